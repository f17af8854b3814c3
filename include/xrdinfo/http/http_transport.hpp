#pragma once

#include <xrdinfo/core/log.hpp>
#include <xrdinfo/http/i_http_transport.hpp>

#include <memory>
#include <optional>
#include <string>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// TlsOptions — client-certificate authentication and server verification.
// ---------------------------------------------------------------------------
struct TlsOptions {
    std::optional<std::string> cert_file;  // PEM client certificate
    std::optional<std::string> key_file;   // PEM private key
    std::optional<std::string> ca_file;    // PEM CA bundle for the server
    // When false, server certificates are not checked (self-signed test
    // gateways); only honoured when no CA bundle is given.
    bool verify_server = false;

    [[nodiscard]] bool HasClientCert() const noexcept {
        return cert_file.has_value() && key_file.has_value();
    }

    [[nodiscard]] bool Enabled() const noexcept {
        return HasClientCert() || ca_file.has_value() || verify_server;
    }
};

struct HttpTransportOptions {
    TlsOptions tls;
    std::shared_ptr<Logger> logger;
};

// ---------------------------------------------------------------------------
// HttpTransport — IHttpTransport implementation using cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. A fresh client (and
// TLS connection) is opened per call; the connect and read timeouts both use
// the per-call timeout.
// ---------------------------------------------------------------------------
class HttpTransport : public IHttpTransport {
public:
    explicit HttpTransport(HttpTransportOptions options = {});
    ~HttpTransport() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view url,
        const HttpHeaders& headers,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view url,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers,
        std::chrono::milliseconds timeout) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xrdinfo
