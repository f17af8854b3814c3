#pragma once

#include <xrdinfo/core/result.hpp>

#include <cctype>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// HttpHeaders — header name/value pairs. Names keep the case they arrived
// with; use FindHeader for case-insensitive lookup.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse — the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

inline bool IEquals(std::string_view lhs, std::string_view rhs) {
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

inline std::optional<std::string> FindHeader(const HttpHeaders& headers,
                                             std::string_view key) {
    for (const auto& [k, v] : headers) {
        if (IEquals(k, key)) {
            return v;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// IHttpTransport — abstract blocking HTTP(S) transport.
//
// Configuration fetching and metadata requests depend on this interface
// rather than on a concrete HTTP client, so they can be tested offline via
// MockHttpTransport. URLs are absolute ("https://host:port/path?query").
//
// A transport failure (refused connection, TLS handshake, timeout) is an
// Err; any HTTP status, including 4xx/5xx, is an Ok response for the caller
// to interpret.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport& operator=(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&) = delete;
    IHttpTransport& operator=(IHttpTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view url,
        const HttpHeaders& headers,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view url,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers,
        std::chrono::milliseconds timeout) = 0;

protected:
    IHttpTransport() = default;
};

} // namespace xrdinfo
