#pragma once

#include <xrdinfo/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace xrdinfo {

// Algorithm identifiers used in configuration directory headers.
namespace algorithm_uri {
constexpr const char* kSha1 = "http://www.w3.org/2000/09/xmldsig#sha1";
constexpr const char* kSha256 = "http://www.w3.org/2001/04/xmlenc#sha256";
constexpr const char* kSha384 = "http://www.w3.org/2001/04/xmldsig-more#sha384";
constexpr const char* kSha512 = "http://www.w3.org/2001/04/xmlenc#sha512";

constexpr const char* kRsaSha1 = "http://www.w3.org/2000/09/xmldsig#rsa-sha1";
constexpr const char* kRsaSha256 = "http://www.w3.org/2001/04/xmldsig-more#rsa-sha256";
constexpr const char* kRsaSha384 = "http://www.w3.org/2001/04/xmldsig-more#rsa-sha384";
constexpr const char* kRsaSha512 = "http://www.w3.org/2001/04/xmldsig-more#rsa-sha512";
constexpr const char* kEcdsaSha256 = "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha256";
constexpr const char* kEcdsaSha384 = "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha384";
constexpr const char* kEcdsaSha512 = "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha512";
} // namespace algorithm_uri

/// Decode base64, ignoring embedded whitespace. nullopt on invalid input.
std::optional<std::string> Base64Decode(std::string_view encoded);

std::string Base64Encode(std::string_view data);

/// Digest of data with the algorithm named by a digest URI. Unknown URIs
/// yield an Integrity error.
Result<std::string, Error> ComputeDigest(std::string_view algorithm_uri,
                                         std::string_view data);

} // namespace xrdinfo
