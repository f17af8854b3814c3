#pragma once

#include <xrdinfo/conf/configuration_anchor.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/result.hpp>
#include <xrdinfo/http/i_http_transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace xrdinfo {

struct FetchOptions {
    std::chrono::milliseconds timeout{5000};
    std::shared_ptr<Logger> logger;
};

// ---------------------------------------------------------------------------
// FetchedBundle — raw bytes served by one configuration source.
// ---------------------------------------------------------------------------
struct FetchedBundle {
    std::string source_url;      // URL that served the directory
    std::string content_type;    // its Content-Type header, may be empty
    std::string directory_body;
    // Content files keyed by Content-location as listed in the directory.
    std::map<std::string, std::string> contents;
};

// ---------------------------------------------------------------------------
// ConfigurationFetcher — downloads the signed directory and every content
// file it lists from the first source that answers.
//
// Sources are tried in listed order. A transport failure, timeout or non-2xx
// answer (for the directory or any of its content files) moves on to the
// next source; only when all sources failed is the last failure returned,
// as a Network or Timeout error. A directory that cannot be parsed aborts
// with a Format error without trying further sources.
//
// TLS client authentication is configured on the transport.
// ---------------------------------------------------------------------------
class ConfigurationFetcher {
public:
    explicit ConfigurationFetcher(IHttpTransport& transport, FetchOptions options = {});

    [[nodiscard]] Result<FetchedBundle, Error> Fetch(const ConfigurationAnchor& anchor) const;

    [[nodiscard]] Result<FetchedBundle, Error> Fetch(
        const std::vector<std::string>& source_urls) const;

private:
    IHttpTransport& transport_;
    FetchOptions options_;
    std::shared_ptr<Logger> logger_;
};

} // namespace xrdinfo
