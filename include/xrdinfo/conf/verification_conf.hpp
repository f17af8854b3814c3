#pragma once

#include <xrdinfo/conf/shared_params.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/result.hpp>
#include <xrdinfo/http/i_http_transport.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace xrdinfo {

struct SecurityServerLoadOptions {
    std::chrono::milliseconds timeout{5000};
    // Instance whose shared parameters to read; the server's own instance
    // (verificationconf/instance-identifier) when unset.
    std::optional<std::string> instance;
    // Scheme added to a bare host address.
    bool use_tls = false;
    std::shared_ptr<Logger> logger;
};

// ---------------------------------------------------------------------------
// Verification configuration of a security server.
//
// A security server serves the global configuration it has already verified
// as a zip archive at /verificationconf:
//
//   verificationconf/instance-identifier
//   verificationconf/<instance>/shared-params.xml
//   verificationconf/<instance>/private-params.xml (ignored)
//
// The archive carries no signatures, so it is only as trustworthy as the
// connection to the security server.
// ---------------------------------------------------------------------------

struct VerificationConfEntry {
    std::string instance;
    std::string shared_params_xml;
};

/// Extract shared-params.xml for instance (or the archive's own instance)
/// from a verificationconf archive.
Result<VerificationConfEntry, Error> ReadVerificationConf(
    const std::string& archive, const std::optional<std::string>& instance,
    const std::string& location = "verificationconf");

/// GET <server>/verificationconf and parse the selected instance's shared
/// parameters. server may be a bare host; "/verificationconf" is added when
/// the URL has no path. A non-2xx answer or a transport failure is returned
/// as is; a broken archive or missing entry is a Format error.
Result<SharedParams, Error> LoadSharedParamsFromSecurityServer(
    IHttpTransport& transport, const std::string& server,
    const SecurityServerLoadOptions& options = {});

} // namespace xrdinfo
