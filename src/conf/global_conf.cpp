#include <xrdinfo/conf/global_conf.hpp>
#include <xrdinfo/conf/configuration_fetcher.hpp>
#include <xrdinfo/conf/directory_parser.hpp>

#include <algorithm>

namespace xrdinfo {

Result<GlobalConfiguration, Error> LoadGlobalConfiguration(IHttpTransport& transport,
                                                           const ConfigurationAnchor& anchor,
                                                           const LoadOptions& options) {
    auto logger = OrSilent(options.logger);

    ConfigurationFetcher fetcher(transport, FetchOptions{options.timeout, logger});
    auto bundle = fetcher.Fetch(anchor);
    if (bundle.IsErr()) {
        return Result<GlobalConfiguration, Error>::Err(bundle.Error());
    }

    auto directory = ParseDirectory(bundle.Value().content_type, bundle.Value().directory_body);
    if (directory.IsErr()) {
        return Result<GlobalConfiguration, Error>::Err(directory.Error());
    }

    auto parts = AttachContent(directory.Value(), bundle.Value().contents);
    if (parts.IsErr()) {
        return Result<GlobalConfiguration, Error>::Err(parts.Error());
    }

    TrustVerifier verifier(anchor, TrustVerifierOptions{options.clock, logger});
    auto verified = verifier.Verify(directory.Value(), std::move(parts).Value());
    if (verified.IsErr()) {
        return Result<GlobalConfiguration, Error>::Err(verified.Error());
    }

    const auto& verified_parts = verified.Value();
    auto shared = std::find_if(verified_parts.begin(), verified_parts.end(),
                               [&](const VerifiedPart& p) {
                                   return p.Part().content_identifier == kSharedParametersId &&
                                          p.Part().instance == anchor.InstanceIdentifier();
                               });
    if (shared == verified_parts.end()) {
        return Result<GlobalConfiguration, Error>::Err(Error{
            "LoadGlobalConfiguration", bundle.Value().source_url, std::nullopt,
            "Configuration has no shared parameters for instance " +
                anchor.InstanceIdentifier(),
            std::nullopt, ErrorCategory::Format});
    }

    auto params = SharedParams::Parse(*shared);
    if (params.IsErr()) {
        return Result<GlobalConfiguration, Error>::Err(params.Error());
    }

    const bool stale = std::any_of(verified_parts.begin(), verified_parts.end(),
                                   [](const VerifiedPart& p) { return p.Stale(); });
    if (stale) {
        logger->Warn("conf", "Global configuration is expired; using it as stale");
    }

    return Result<GlobalConfiguration, Error>::Ok(GlobalConfiguration{
        bundle.Value().source_url, std::move(verified).Value(), std::move(params).Value(),
        stale});
}

} // namespace xrdinfo
