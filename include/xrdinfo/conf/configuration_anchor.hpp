#pragma once

#include <xrdinfo/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// AnchorSource — one configuration source listed in the anchor.
// ---------------------------------------------------------------------------
struct AnchorSource {
    std::string download_url;
    // DER-encoded X.509 certificates trusted to sign this source's directory.
    std::vector<std::string> verification_certs;
};

// ---------------------------------------------------------------------------
// ConfigurationAnchor — the trust root of an instance.
//
// Loaded from the anchor XML distributed by the central server:
//
//   <configurationAnchor>
//     <instanceIdentifier>EE</instanceIdentifier>
//     <source>
//       <downloadURL>http://cs.example.org/internalconf</downloadURL>
//       <verificationCert>MIIC...</verificationCert>
//     </source>
//   </configurationAnchor>
//
// Immutable once built. Sources are tried in listed order.
// ---------------------------------------------------------------------------
class ConfigurationAnchor {
public:
    ConfigurationAnchor(std::string instance_identifier,
                        std::vector<AnchorSource> sources);

    /// Anchor without trust material; a load through it fails verification,
    /// but the URLs can still be fetched.
    static ConfigurationAnchor FromUrls(std::string instance_identifier,
                                        const std::vector<std::string>& urls);

    [[nodiscard]] static Result<ConfigurationAnchor, Error> Parse(std::string_view xml);

    [[nodiscard]] static Result<ConfigurationAnchor, Error> LoadFile(const std::string& path);

    [[nodiscard]] const std::string& InstanceIdentifier() const noexcept {
        return instance_identifier_;
    }
    [[nodiscard]] const std::vector<AnchorSource>& Sources() const noexcept {
        return sources_;
    }

    [[nodiscard]] std::vector<std::string> SourceUrls() const;

    /// All trusted certificates across sources, duplicates removed.
    [[nodiscard]] std::vector<std::string> VerificationCerts() const;

private:
    std::string instance_identifier_;
    std::vector<AnchorSource> sources_;
};

} // namespace xrdinfo
