#include <xrdinfo/http/http_transport.hpp>
#include <xrdinfo/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace xrdinfo {

namespace {

constexpr const char* kComponent = "http";

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         const std::string& message,
                         ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt, category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& extra) {
    httplib::Headers hdrs;
    for (const auto& [key, value] : extra) {
        hdrs.emplace(key, value);
    }
    return hdrs;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(),
                   lower_key.begin(), ::tolower);
    return lower_key == "cookie" ||
           lower_key == "set-cookie" ||
           lower_key == "authorization" ||
           lower_key == "proxy-authorization";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding TLS material and the logger.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    TlsOptions tls;
    std::shared_ptr<Logger> logger;

    explicit Impl(HttpTransportOptions opts)
        : tls(std::move(opts.tls)), logger(OrSilent(std::move(opts.logger))) {}

    std::unique_ptr<httplib::Client> MakeClient(const UrlParts& parts,
                                                std::chrono::milliseconds timeout) const {
        const auto origin = parts.Origin();
        std::unique_ptr<httplib::Client> client;
        if (parts.scheme == "https" && tls.HasClientCert()) {
            client = std::make_unique<httplib::Client>(origin, *tls.cert_file,
                                                       *tls.key_file);
        } else {
            client = std::make_unique<httplib::Client>(origin);
        }
        client->set_connection_timeout(timeout);
        client->set_read_timeout(timeout);
        client->set_write_timeout(timeout);

        if (parts.scheme == "https") {
            if (tls.ca_file.has_value()) {
                client->set_ca_cert_path(*tls.ca_file);
                client->enable_server_certificate_verification(true);
            } else {
                client->enable_server_certificate_verification(tls.verify_server);
            }
        }
        return client;
    }

    void LogRequestHeaders(const httplib::Headers& hdrs) const {
        if (!logger->Enabled(LogLevel::Debug)) return;
        for (const auto& [k, v] : hdrs) {
            if (IsSensitiveHeader(k)) {
                logger->Debug(kComponent, "  > " + k + ": <redacted>");
            } else {
                logger->Debug(kComponent, "  > " + k + ": " + v);
            }
        }
    }

    void LogResponse(int status, const std::string& body) const {
        logger->Info(kComponent, "  < " + std::to_string(status));
        if (status >= 400 && !body.empty()) {
            constexpr size_t kMaxBodyLog = 2000;
            if (body.size() <= kMaxBodyLog) {
                logger->Debug(kComponent, "  < body: " + body);
            } else {
                logger->Debug(kComponent, "  < body: " + body.substr(0, kMaxBodyLog) +
                                              "... (truncated)");
            }
        }
    }

    Result<HttpResponse, Error> Finish(const std::string& operation,
                                       const std::string& url,
                                       httplib::Result& res) const {
        if (!res) {
            const auto http_error = res.error();
            logger->Debug(kComponent, "  ! " + httplib::to_string(http_error));
            return Result<HttpResponse, Error>::Err(
                MakeTransportError(operation, url,
                                   "HTTP request failed: " +
                                       httplib::to_string(http_error),
                                   CategoryFromHttpTransportError(http_error)));
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<UrlParts, Error> Split(const std::string& operation,
                                  const std::string& url) const {
        auto parts = SplitUrl(url);
        if (parts.scheme != "http" && parts.scheme != "https") {
            return Result<UrlParts, Error>::Err(MakeTransportError(
                operation, url, "Unsupported URL scheme '" + parts.scheme + "'",
                ErrorCategory::InvalidArgument));
        }
        if (parts.authority.empty()) {
            return Result<UrlParts, Error>::Err(MakeTransportError(
                operation, url, "URL has no host", ErrorCategory::InvalidArgument));
        }
        if (parts.path_query.empty()) {
            parts.path_query = "/";
        }
        return Result<UrlParts, Error>::Ok(std::move(parts));
    }

    Result<HttpResponse, Error> DoGet(std::string_view url_view,
                                      const HttpHeaders& extra_headers,
                                      std::chrono::milliseconds timeout) {
        const std::string url(url_view);
        auto parts = Split("Get", url);
        if (parts.IsErr()) {
            return Result<HttpResponse, Error>::Err(parts.Error());
        }
        auto hdrs = ToHttplibHeaders(extra_headers);
        logger->Info(kComponent, "GET " + url);
        LogRequestHeaders(hdrs);
        auto client = MakeClient(parts.Value(), timeout);
        auto res = client->Get(parts.Value().path_query, hdrs);
        return Finish("Get", url, res);
    }

    Result<HttpResponse, Error> DoPost(std::string_view url_view,
                                       std::string_view body,
                                       std::string_view content_type,
                                       const HttpHeaders& extra_headers,
                                       std::chrono::milliseconds timeout) {
        const std::string url(url_view);
        auto parts = Split("Post", url);
        if (parts.IsErr()) {
            return Result<HttpResponse, Error>::Err(parts.Error());
        }
        auto hdrs = ToHttplibHeaders(extra_headers);
        logger->Info(kComponent, "POST " + url);
        LogRequestHeaders(hdrs);
        auto client = MakeClient(parts.Value(), timeout);
        auto res = client->Post(parts.Value().path_query, hdrs,
                                std::string(body), std::string(content_type));
        return Finish("Post", url, res);
    }
};

// ---------------------------------------------------------------------------
// HttpTransport public interface — delegates to Impl.
// ---------------------------------------------------------------------------

HttpTransport::HttpTransport(HttpTransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpTransport::~HttpTransport() = default;

Result<HttpResponse, Error> HttpTransport::Get(std::string_view url,
                                               const HttpHeaders& headers,
                                               std::chrono::milliseconds timeout) {
    return impl_->DoGet(url, headers, timeout);
}

Result<HttpResponse, Error> HttpTransport::Post(std::string_view url,
                                                std::string_view body,
                                                std::string_view content_type,
                                                const HttpHeaders& headers,
                                                std::chrono::milliseconds timeout) {
    return impl_->DoPost(url, body, content_type, headers, timeout);
}

} // namespace xrdinfo
