#include <xrdinfo/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace xrdinfo {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string UrlDecode(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const int hi = HexValue(value[i + 1]);
            const int lo = HexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += value[i];
    }
    return decoded;
}

UrlParts SplitUrl(std::string_view url) {
    UrlParts parts;
    auto scheme_end = url.find("://");
    std::string_view rest = url;
    if (scheme_end != std::string_view::npos) {
        parts.scheme = std::string(url.substr(0, scheme_end));
        rest = url.substr(scheme_end + 3);
    }
    auto path_start = rest.find_first_of("/?");
    if (path_start == std::string_view::npos) {
        parts.authority = std::string(rest);
    } else {
        parts.authority = std::string(rest.substr(0, path_start));
        parts.path_query = std::string(rest.substr(path_start));
        if (parts.path_query[0] == '?') {
            parts.path_query.insert(parts.path_query.begin(), '/');
        }
    }
    return parts;
}

bool HasScheme(std::string_view url) {
    return url.find("://") != std::string_view::npos;
}

std::string AddUrlScheme(std::string_view address, bool use_tls) {
    if (HasScheme(address)) {
        return std::string(address);
    }
    return (use_tls ? "https://" : "http://") + std::string(address);
}

std::string WithDefaultPath(std::string_view url, std::string_view default_path) {
    auto parts = SplitUrl(url);
    std::string result(url);
    if (parts.path_query.empty()) {
        result += "/";
        result += default_path;
    } else if (parts.path_query == "/") {
        result += default_path;
    }
    return result;
}

std::string ResolveUrl(std::string_view base, std::string_view reference) {
    if (HasScheme(reference)) {
        return std::string(reference);
    }
    auto parts = SplitUrl(base);
    if (!reference.empty() && reference[0] == '/') {
        return parts.Origin() + std::string(reference);
    }
    // Relative reference: replace the last path segment of base.
    auto path = parts.path_query.substr(0, parts.path_query.find('?'));
    auto last_slash = path.rfind('/');
    std::string directory =
        last_slash == std::string::npos ? "/" : path.substr(0, last_slash + 1);
    return parts.Origin() + directory + std::string(reference);
}

} // namespace xrdinfo
