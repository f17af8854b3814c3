#include <xrdinfo/conf/directory_parser.hpp>
#include <xrdinfo/core/multipart.hpp>

namespace xrdinfo {

namespace {

Error DirectoryError(const std::string& message) {
    return Error{"ParseDirectory", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Format};
}

std::string TrimBody(const std::string& body) {
    const auto first = body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = body.find_last_not_of(" \t\r\n");
    return body.substr(first, last - first + 1);
}

Result<std::optional<TimePoint>, Error> ExpireDate(const MimePart& part) {
    auto header = part.Header("Expire-date");
    if (!header.has_value()) {
        return Result<std::optional<TimePoint>, Error>::Ok(std::nullopt);
    }
    auto parsed = ParseIso8601(*header);
    if (!parsed.has_value()) {
        return Result<std::optional<TimePoint>, Error>::Err(
            DirectoryError("Invalid Expire-date '" + *header + "'"));
    }
    return Result<std::optional<TimePoint>, Error>::Ok(parsed);
}

Result<std::string, Error> RequireHeader(const MimePart& part, const char* name,
                                         const std::string& context) {
    auto value = part.Header(name);
    if (!value.has_value() || value->empty()) {
        return Result<std::string, Error>::Err(
            DirectoryError(context + " lacks the " + name + " header"));
    }
    return Result<std::string, Error>::Ok(std::move(*value));
}

Result<DirectoryEntry, Error> ParseEntry(const MimePart& part,
                                         size_t base_offset,
                                         size_t index,
                                         const std::optional<TimePoint>& default_expiration) {
    const std::string context = "Directory entry " + std::to_string(index + 1);

    auto identifier = RequireHeader(part, "Content-Identifier", context);
    if (identifier.IsErr()) {
        return Result<DirectoryEntry, Error>::Err(identifier.Error());
    }
    auto location = RequireHeader(part, "Content-location", context);
    if (location.IsErr()) {
        return Result<DirectoryEntry, Error>::Err(location.Error());
    }
    auto algorithm = RequireHeader(part, "Hash-algorithm-id", context);
    if (algorithm.IsErr()) {
        return Result<DirectoryEntry, Error>::Err(algorithm.Error());
    }

    DirectoryEntry entry;
    entry.content_identifier = HeaderMainValue(identifier.Value());
    auto instance = HeaderParam(identifier.Value(), "instance");
    if (entry.content_identifier.empty() || !instance.has_value() || instance->empty()) {
        return Result<DirectoryEntry, Error>::Err(DirectoryError(
            context + " has a malformed Content-Identifier '" + identifier.Value() + "'"));
    }
    entry.instance = *instance;
    entry.location = location.Value();
    entry.digest_algorithm = algorithm.Value();
    entry.digest_value = TrimBody(part.body);
    if (entry.digest_value.empty()) {
        return Result<DirectoryEntry, Error>::Err(
            DirectoryError(context + " (" + entry.location + ") has no digest"));
    }

    auto expiration = ExpireDate(part);
    if (expiration.IsErr()) {
        return Result<DirectoryEntry, Error>::Err(expiration.Error());
    }
    entry.expiration = expiration.Value().has_value() ? expiration.Value()
                                                      : default_expiration;
    entry.version = part.Header("Version");
    entry.offset = base_offset + part.offset;
    entry.length = part.length;
    return Result<DirectoryEntry, Error>::Ok(std::move(entry));
}

} // anonymous namespace

Result<ConfigurationDirectory, Error> ParseDirectory(std::string_view content_type,
                                                     std::string_view body) {
    auto boundary = BoundaryFromContentType(content_type);
    if (!boundary.has_value()) {
        boundary = BoundaryFromBody(body);
    }
    if (!boundary.has_value()) {
        return Result<ConfigurationDirectory, Error>::Err(
            DirectoryError("Configuration bundle has no multipart boundary"));
    }

    auto envelope = SplitMultipart(body, *boundary);
    if (envelope.IsErr()) {
        auto error = envelope.Error();
        error.operation = "ParseDirectory";
        return Result<ConfigurationDirectory, Error>::Err(std::move(error));
    }
    const auto& parts = envelope.Value();
    if (parts.size() < 2) {
        return Result<ConfigurationDirectory, Error>::Err(DirectoryError(
            "Configuration bundle has " + std::to_string(parts.size()) +
            " part(s); expected directory and signature"));
    }

    const auto& listing = parts[0];
    const auto& signature = parts[1];

    ConfigurationDirectory directory;
    directory.signed_data = listing.raw;

    auto expiration = ExpireDate(listing);
    if (expiration.IsErr()) {
        return Result<ConfigurationDirectory, Error>::Err(expiration.Error());
    }
    directory.expiration = expiration.Value();
    directory.version = listing.Header("Version");

    // -- Directory listing ---------------------------------------------------

    std::optional<std::string> inner_boundary;
    if (auto inner_type = listing.Header("Content-Type")) {
        inner_boundary = BoundaryFromContentType(*inner_type);
    }
    if (!inner_boundary.has_value()) {
        inner_boundary = BoundaryFromBody(listing.body);
    }
    if (!inner_boundary.has_value()) {
        return Result<ConfigurationDirectory, Error>::Err(
            DirectoryError("Directory part has no multipart boundary"));
    }

    auto rows = SplitMultipart(listing.body, *inner_boundary);
    if (rows.IsErr()) {
        auto error = rows.Error();
        error.operation = "ParseDirectory";
        return Result<ConfigurationDirectory, Error>::Err(std::move(error));
    }

    // The listing body is a suffix of its raw bytes.
    const size_t body_offset = listing.raw.size() - listing.body.size();
    for (size_t i = 0; i < rows.Value().size(); ++i) {
        auto entry = ParseEntry(rows.Value()[i], body_offset, i, directory.expiration);
        if (entry.IsErr()) {
            return Result<ConfigurationDirectory, Error>::Err(entry.Error());
        }
        directory.entries.push_back(std::move(entry).Value());
    }

    // -- Signature -----------------------------------------------------------

    auto algorithm = RequireHeader(signature, "Signature-algorithm-id", "Signature part");
    if (algorithm.IsErr()) {
        return Result<ConfigurationDirectory, Error>::Err(algorithm.Error());
    }
    directory.signature_algorithm = algorithm.Value();
    directory.signature = TrimBody(signature.body);
    if (directory.signature.empty()) {
        return Result<ConfigurationDirectory, Error>::Err(
            DirectoryError("Signature part is empty"));
    }
    if (auto cert_hash = signature.Header("Verification-certificate-hash")) {
        directory.verification_cert_hash = HeaderMainValue(*cert_hash);
        directory.verification_cert_hash_algorithm =
            HeaderParam(*cert_hash, "hash-algorithm-id").value_or("");
    }

    return Result<ConfigurationDirectory, Error>::Ok(std::move(directory));
}

Result<std::vector<ConfigurationPart>, Error> AttachContent(
    const ConfigurationDirectory& directory,
    const std::map<std::string, std::string>& content_by_location) {
    std::vector<ConfigurationPart> parts;
    parts.reserve(directory.entries.size());
    for (const auto& entry : directory.entries) {
        auto content = content_by_location.find(entry.location);
        if (content == content_by_location.end()) {
            return Result<std::vector<ConfigurationPart>, Error>::Err(Error{
                "AttachContent", entry.location, std::nullopt,
                "No content fetched for " + entry.content_identifier,
                std::nullopt, ErrorCategory::Format});
        }
        ConfigurationPart part;
        part.content_identifier = entry.content_identifier;
        part.instance = entry.instance;
        part.location = entry.location;
        part.expiration = entry.expiration;
        part.digest_algorithm = entry.digest_algorithm;
        part.digest_value = entry.digest_value;
        part.version = entry.version;
        part.raw_bytes = content->second;
        part.directory_offset = entry.offset;
        part.directory_length = entry.length;
        parts.push_back(std::move(part));
    }
    return Result<std::vector<ConfigurationPart>, Error>::Ok(std::move(parts));
}

} // namespace xrdinfo
