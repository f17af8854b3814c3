#pragma once

#include <string>
#include <string_view>

namespace xrdinfo {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else, '/' included, is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Reverse of UrlEncode. Any well-formed %XX sequence is decoded (hex digits
// in either case); malformed sequences and '+' are kept as they are.
std::string UrlDecode(std::string_view value);

// ---------------------------------------------------------------------------
// UrlParts — "scheme://authority" plus the path and query that follow it.
// ---------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;      // "http", "https"; empty if absent
    std::string authority;   // host[:port]
    std::string path_query;  // "/path?query"; empty if absent

    [[nodiscard]] std::string Origin() const {
        return scheme + "://" + authority;
    }
};

UrlParts SplitUrl(std::string_view url);

[[nodiscard]] bool HasScheme(std::string_view url);

// Prefix a bare host (or host/path) with https:// when TLS is in play,
// otherwise http://. URLs that already carry a scheme are returned unchanged.
std::string AddUrlScheme(std::string_view address, bool use_tls);

// Append default_path ("internalconf") when the URL has no path or just "/".
std::string WithDefaultPath(std::string_view url, std::string_view default_path);

// Resolve a reference (absolute URL, absolute path or relative path)
// against base the way a browser would for the common cases.
std::string ResolveUrl(std::string_view base, std::string_view reference);

} // namespace xrdinfo
