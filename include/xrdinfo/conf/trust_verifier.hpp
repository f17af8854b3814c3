#pragma once

#include <xrdinfo/conf/configuration_anchor.hpp>
#include <xrdinfo/conf/directory_parser.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/result.hpp>
#include <xrdinfo/core/timestamp.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace xrdinfo {

class TrustVerifier;

// ---------------------------------------------------------------------------
// VerifiedPart — a configuration part whose digest and directory signature
// were checked against the anchor. Only TrustVerifier creates these.
//
// An expired part is still returned, flagged Stale().
// ---------------------------------------------------------------------------
class VerifiedPart {
public:
    [[nodiscard]] const ConfigurationPart& Part() const noexcept { return part_; }
    [[nodiscard]] bool Stale() const noexcept { return stale_; }

private:
    friend class TrustVerifier;
    VerifiedPart(ConfigurationPart part, bool stale)
        : part_(std::move(part)), stale_(stale) {}

    ConfigurationPart part_;
    bool stale_ = false;
};

struct TrustVerifierOptions {
    // Current time; defaults to the system clock.
    std::function<TimePoint()> clock;
    std::shared_ptr<Logger> logger;
};

// ---------------------------------------------------------------------------
// TrustVerifier — checks a fetched bundle against the anchor.
//
//   1. the directory signature must verify with a certificate of the anchor
//      (Trust error otherwise);
//   2. every part must belong to the anchor's instance (Trust error);
//   3. every part's content must match its listed digest (Integrity error);
//   4. parts past their expiration are flagged stale.
// ---------------------------------------------------------------------------
class TrustVerifier {
public:
    explicit TrustVerifier(const ConfigurationAnchor& anchor,
                           TrustVerifierOptions options = {});

    [[nodiscard]] Result<void, Error> VerifySignature(
        const ConfigurationDirectory& directory) const;

    [[nodiscard]] Result<std::vector<VerifiedPart>, Error> Verify(
        const ConfigurationDirectory& directory,
        std::vector<ConfigurationPart> parts) const;

private:
    ConfigurationAnchor anchor_;
    std::function<TimePoint()> clock_;
    std::shared_ptr<Logger> logger_;
};

} // namespace xrdinfo
