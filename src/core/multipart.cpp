#include <xrdinfo/core/multipart.hpp>

#include <algorithm>
#include <cctype>

namespace xrdinfo {

namespace {

bool IEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        const auto lc = static_cast<unsigned char>(lhs[i]);
        const auto rc = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

Error FormatError(const std::string& message) {
    return Error{"SplitMultipart", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Format};
}

// Position of the next delimiter that starts a line, searching from `from`.
size_t FindDelimiter(std::string_view body, std::string_view delimiter, size_t from) {
    while (true) {
        auto pos = body.find(delimiter, from);
        if (pos == std::string_view::npos) {
            return pos;
        }
        if (pos == 0 || body[pos - 1] == '\n') {
            return pos;
        }
        from = pos + 1;
    }
}

// Skip transport padding and the line break that ends a delimiter line.
size_t SkipLineEnd(std::string_view body, size_t pos) {
    while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
        ++pos;
    }
    if (pos < body.size() && body[pos] == '\r') ++pos;
    if (pos < body.size() && body[pos] == '\n') ++pos;
    return pos;
}

} // anonymous namespace

std::optional<std::string> MimePart::Header(std::string_view name) const {
    for (const auto& h : headers) {
        if (IEquals(h.name, name)) {
            return h.value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HeaderParam(std::string_view header_value,
                                       std::string_view param) {
    size_t pos = header_value.find(';');
    while (pos != std::string_view::npos) {
        auto next = header_value.find(';', pos + 1);
        auto item = Trim(header_value.substr(pos + 1, next == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : next - pos - 1));
        auto eq = item.find('=');
        if (eq != std::string_view::npos && IEquals(Trim(item.substr(0, eq)), param)) {
            auto value = Trim(item.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
        pos = next;
    }
    return std::nullopt;
}

std::string HeaderMainValue(std::string_view header_value) {
    return std::string(Trim(header_value.substr(0, header_value.find(';'))));
}

std::optional<std::string> BoundaryFromContentType(std::string_view content_type) {
    auto main = HeaderMainValue(content_type);
    std::transform(main.begin(), main.end(), main.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (main.rfind("multipart/", 0) != 0) {
        return std::nullopt;
    }
    auto boundary = HeaderParam(content_type, "boundary");
    if (!boundary.has_value() || boundary->empty()) {
        return std::nullopt;
    }
    return boundary;
}

std::optional<std::string> BoundaryFromBody(std::string_view body) {
    size_t pos = 0;
    // Skip a preamble of blank lines.
    while (pos < body.size() && (body[pos] == '\r' || body[pos] == '\n')) {
        ++pos;
    }
    if (body.substr(pos, 2) != "--") {
        return std::nullopt;
    }
    auto line_end = body.find_first_of("\r\n", pos);
    auto boundary = Trim(body.substr(pos + 2, line_end == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : line_end - pos - 2));
    if (boundary.empty()) {
        return std::nullopt;
    }
    return std::string(boundary);
}

std::vector<MimeHeader> ParseHeaderBlock(std::string_view block) {
    std::vector<MimeHeader> headers;
    size_t pos = 0;
    while (pos < block.size()) {
        auto line_end = block.find('\n', pos);
        auto line = block.substr(pos, line_end == std::string_view::npos
                                          ? std::string_view::npos
                                          : line_end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        pos = line_end == std::string_view::npos ? block.size() : line_end + 1;
        if (line.empty()) {
            continue;
        }
        if ((line[0] == ' ' || line[0] == '\t') && !headers.empty()) {
            headers.back().value += " ";
            headers.back().value += std::string(Trim(line));
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        headers.push_back({std::string(Trim(line.substr(0, colon))),
                           std::string(Trim(line.substr(colon + 1)))});
    }
    return headers;
}

Result<std::vector<MimePart>, Error> SplitMultipart(std::string_view body,
                                                    std::string_view boundary) {
    if (boundary.empty()) {
        return Result<std::vector<MimePart>, Error>::Err(
            FormatError("Multipart boundary must not be empty"));
    }
    const std::string delimiter = "--" + std::string(boundary);

    auto pos = FindDelimiter(body, delimiter, 0);
    if (pos == std::string_view::npos) {
        return Result<std::vector<MimePart>, Error>::Err(
            FormatError("Boundary marker '" + delimiter + "' not found"));
    }

    std::vector<MimePart> parts;
    while (true) {
        const size_t after = pos + delimiter.size();
        if (body.substr(after, 2) == "--") {
            return Result<std::vector<MimePart>, Error>::Ok(std::move(parts));
        }

        const size_t start = SkipLineEnd(body, after);
        const auto next = FindDelimiter(body, delimiter, start);
        if (next == std::string_view::npos) {
            return Result<std::vector<MimePart>, Error>::Err(
                FormatError("Closing boundary marker '" + delimiter + "--' not found"));
        }

        // The line break before the next delimiter belongs to the delimiter.
        size_t end = next;
        if (end > start && body[end - 1] == '\n') --end;
        if (end > start && body[end - 1] == '\r') --end;

        MimePart part;
        part.offset = start;
        part.length = end - start;
        part.raw = std::string(body.substr(start, end - start));

        std::string_view raw(part.raw);
        size_t header_end = std::string_view::npos;
        size_t body_start = 0;
        if (raw.rfind("\r\n", 0) == 0) {
            header_end = 0;
            body_start = 2;
        } else if (raw.rfind("\n", 0) == 0) {
            header_end = 0;
            body_start = 1;
        } else if (auto crlf = raw.find("\r\n\r\n"); crlf != std::string_view::npos) {
            header_end = crlf;
            body_start = crlf + 4;
        } else if (auto lf = raw.find("\n\n"); lf != std::string_view::npos) {
            header_end = lf;
            body_start = lf + 2;
        }

        if (header_end == std::string_view::npos) {
            part.headers = ParseHeaderBlock(raw);
        } else {
            part.headers = ParseHeaderBlock(raw.substr(0, header_end));
            part.body = std::string(raw.substr(body_start));
        }

        parts.push_back(std::move(part));
        pos = next;
    }
}

} // namespace xrdinfo
