#pragma once

#include <xrdinfo/core/result.hpp>
#include <xrdinfo/core/timestamp.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

// Content identifiers of the directory entries this library reads.
constexpr const char* kSharedParametersId = "SHARED-PARAMETERS";
constexpr const char* kPrivateParametersId = "PRIVATE-PARAMETERS";

// ---------------------------------------------------------------------------
// DirectoryEntry — one row of the signed directory: the metadata of a
// content file and the digest it must match.
// ---------------------------------------------------------------------------
struct DirectoryEntry {
    std::string content_identifier;
    std::string instance;
    std::string location;
    std::optional<TimePoint> expiration;
    std::string digest_algorithm;
    std::string digest_value;  // base64, as listed
    std::optional<std::string> version;
    // Byte range of this entry within the signed directory.
    size_t offset = 0;
    size_t length = 0;
};

// ---------------------------------------------------------------------------
// ConfigurationDirectory — the parsed multipart bundle served by a source.
// ---------------------------------------------------------------------------
struct ConfigurationDirectory {
    // Exact bytes covered by the signature (the whole directory part).
    std::string signed_data;
    std::optional<TimePoint> expiration;
    std::optional<std::string> version;
    std::vector<DirectoryEntry> entries;

    std::string signature_algorithm;
    std::string signature;  // base64
    // Hash of the signing certificate; empty when the source omits it.
    std::string verification_cert_hash;
    std::string verification_cert_hash_algorithm;
};

// ---------------------------------------------------------------------------
// ConfigurationPart — a directory entry together with its content bytes.
// Created per fetch and never trusted until TrustVerifier accepts it.
// ---------------------------------------------------------------------------
struct ConfigurationPart {
    std::string content_identifier;
    std::string instance;
    std::string location;
    std::optional<TimePoint> expiration;
    std::string digest_algorithm;
    std::string digest_value;
    std::optional<std::string> version;
    std::string raw_bytes;
    size_t directory_offset = 0;
    size_t directory_length = 0;
};

/// Parse the bundle. content_type is the HTTP Content-Type header value; when
/// it is empty or carries no boundary, the boundary is taken from the first
/// delimiter line of body.
Result<ConfigurationDirectory, Error> ParseDirectory(std::string_view content_type,
                                                     std::string_view body);

/// Pair every entry with its content, keyed by the entry's location as listed.
/// An entry with no content is a Format error.
Result<std::vector<ConfigurationPart>, Error> AttachContent(
    const ConfigurationDirectory& directory,
    const std::map<std::string, std::string>& content_by_location);

} // namespace xrdinfo
