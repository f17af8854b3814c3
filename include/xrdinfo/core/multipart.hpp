#pragma once

#include <xrdinfo/core/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

struct MimeHeader {
    std::string name;
    std::string value;
};

// ---------------------------------------------------------------------------
// MimePart — one encapsulated part of a multipart body.
//
// raw holds the exact bytes between the delimiter line and the CRLF that
// precedes the next delimiter (header block, blank line and body); offset
// and length locate those bytes in the enclosing body.
// ---------------------------------------------------------------------------
struct MimePart {
    std::vector<MimeHeader> headers;
    std::string body;
    std::string raw;
    size_t offset = 0;
    size_t length = 0;

    /// Case-insensitive header lookup; first occurrence wins.
    [[nodiscard]] std::optional<std::string> Header(std::string_view name) const;
};

/// Extract the boundary parameter of a multipart Content-Type value.
std::optional<std::string> BoundaryFromContentType(std::string_view content_type);

/// Guess the boundary from the first delimiter line of a body ("--xyz").
std::optional<std::string> BoundaryFromBody(std::string_view body);

/// Value of a header parameter (name=value or name="value"), case-insensitive.
std::optional<std::string> HeaderParam(std::string_view header_value,
                                       std::string_view param);

/// Header value up to the first ';', trimmed.
std::string HeaderMainValue(std::string_view header_value);

/// Parse "Name: value" lines (with folded continuation lines).
std::vector<MimeHeader> ParseHeaderBlock(std::string_view block);

/// Split a multipart body on boundary. Fails with a Format error when the
/// first delimiter or the closing delimiter is missing.
Result<std::vector<MimePart>, Error> SplitMultipart(std::string_view body,
                                                    std::string_view boundary);

} // namespace xrdinfo
