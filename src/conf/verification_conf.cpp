#include <xrdinfo/conf/verification_conf.hpp>
#include <xrdinfo/core/url.hpp>

#include <zip.h>

#include <memory>

namespace xrdinfo {

namespace {

constexpr const char* kComponent = "verificationconf";
constexpr const char* kRoot = "verificationconf/";

struct ZipDeleter {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};
struct ZipFileDeleter {
    void operator()(zip_file_t* file) const { zip_fclose(file); }
};

Error ArchiveError(const std::string& location, const std::string& message) {
    return Error{"ReadVerificationConf", location, std::nullopt, message, std::nullopt,
                 ErrorCategory::Format};
}

Result<std::string, Error> ReadEntry(zip_t* archive, const std::string& name,
                                     const std::string& location) {
    zip_stat_t stat;
    zip_stat_init(&stat);
    if (zip_stat(archive, name.c_str(), 0, &stat) != 0 ||
        (stat.valid & ZIP_STAT_SIZE) == 0) {
        return Result<std::string, Error>::Err(
            ArchiveError(location, "Archive has no entry " + name));
    }
    std::unique_ptr<zip_file_t, ZipFileDeleter> file(zip_fopen(archive, name.c_str(), 0));
    if (!file) {
        return Result<std::string, Error>::Err(ArchiveError(
            location, "Cannot open " + name + ": " + zip_strerror(archive)));
    }
    std::string content(static_cast<size_t>(stat.size), '\0');
    const auto read = zip_fread(file.get(), content.data(), stat.size);
    if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size) {
        return Result<std::string, Error>::Err(
            ArchiveError(location, "Cannot read " + name + ": " +
                                       zip_file_strerror(file.get())));
    }
    return Result<std::string, Error>::Ok(std::move(content));
}

std::string TrimWhitespace(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ReadVerificationConf
// ---------------------------------------------------------------------------
Result<VerificationConfEntry, Error> ReadVerificationConf(
    const std::string& archive, const std::optional<std::string>& instance,
    const std::string& location) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* source =
        zip_source_buffer_create(archive.data(), archive.size(), 0, &error);
    if (source == nullptr) {
        const std::string message = zip_error_strerror(&error);
        zip_error_fini(&error);
        return Result<VerificationConfEntry, Error>::Err(
            ArchiveError(location, "Cannot read archive: " + message));
    }
    std::unique_ptr<zip_t, ZipDeleter> zip(zip_open_from_source(source, ZIP_RDONLY, &error));
    if (!zip) {
        const std::string message = zip_error_strerror(&error);
        zip_source_free(source);
        zip_error_fini(&error);
        return Result<VerificationConfEntry, Error>::Err(
            ArchiveError(location, "Not a zip archive: " + message));
    }
    zip_error_fini(&error);

    VerificationConfEntry entry;
    if (instance.has_value()) {
        entry.instance = *instance;
    } else {
        auto identifier =
            ReadEntry(zip.get(), std::string(kRoot) + "instance-identifier", location);
        if (identifier.IsErr()) {
            return Result<VerificationConfEntry, Error>::Err(identifier.Error());
        }
        entry.instance = TrimWhitespace(identifier.Value());
        if (entry.instance.empty()) {
            return Result<VerificationConfEntry, Error>::Err(
                ArchiveError(location, "Archive has an empty instance-identifier"));
        }
    }

    auto xml = ReadEntry(zip.get(), std::string(kRoot) + entry.instance + "/shared-params.xml",
                         location);
    if (xml.IsErr()) {
        return Result<VerificationConfEntry, Error>::Err(xml.Error());
    }
    entry.shared_params_xml = std::move(xml).Value();
    return Result<VerificationConfEntry, Error>::Ok(std::move(entry));
}

// ---------------------------------------------------------------------------
// LoadSharedParamsFromSecurityServer
// ---------------------------------------------------------------------------
Result<SharedParams, Error> LoadSharedParamsFromSecurityServer(
    IHttpTransport& transport, const std::string& server,
    const SecurityServerLoadOptions& options) {
    auto logger = OrSilent(options.logger);
    const auto url =
        WithDefaultPath(AddUrlScheme(server, options.use_tls), "verificationconf");
    logger->Debug(kComponent, "Fetching verification configuration from " + url);

    auto response = transport.Get(url, {}, options.timeout);
    if (response.IsErr()) {
        return Result<SharedParams, Error>::Err(response.Error());
    }
    if (!response.Value().IsSuccess()) {
        return Result<SharedParams, Error>::Err(Error::FromHttpStatus(
            "LoadVerificationConf", url, response.Value().status_code,
            response.Value().body));
    }

    auto entry = ReadVerificationConf(response.Value().body, options.instance, url);
    if (entry.IsErr()) {
        return Result<SharedParams, Error>::Err(entry.Error());
    }
    logger->Info(kComponent, "Using shared parameters of instance " +
                                 entry.Value().instance + " from " + url);
    return SharedParams::ParseDocument(entry.Value().shared_params_xml,
                                       url + "#" + entry.Value().instance, std::nullopt,
                                       entry.Value().instance);
}

} // namespace xrdinfo
