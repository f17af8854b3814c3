#pragma once

#include <xrdinfo/conf/configuration_anchor.hpp>
#include <xrdinfo/conf/shared_params.hpp>
#include <xrdinfo/conf/trust_verifier.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/result.hpp>
#include <xrdinfo/http/i_http_transport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace xrdinfo {

struct LoadOptions {
    std::chrono::milliseconds timeout{5000};
    // Current time for expiration checks; defaults to the system clock.
    std::function<TimePoint()> clock;
    std::shared_ptr<Logger> logger;
};

// ---------------------------------------------------------------------------
// GlobalConfiguration — a fully verified configuration load.
// ---------------------------------------------------------------------------
struct GlobalConfiguration {
    std::string source_url;
    std::vector<VerifiedPart> parts;
    SharedParams shared_params;
    // True when any verified part is past its expiration.
    bool stale = false;
};

/// Fetch, parse, verify and index the configuration of the anchor's
/// instance. Any failure aborts the whole load; nothing partially verified
/// is returned.
Result<GlobalConfiguration, Error> LoadGlobalConfiguration(IHttpTransport& transport,
                                                           const ConfigurationAnchor& anchor,
                                                           const LoadOptions& options = {});

} // namespace xrdinfo
