#pragma once

#include <xrdinfo/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// OpenApiEndpoint — one operation of an OpenAPI (2.x or 3.x) document.
// ---------------------------------------------------------------------------
struct OpenApiEndpoint {
    std::string method;  // upper case: GET, POST, ...
    std::string path;    // path template as written: /pets/{id}
    std::string operation_id;
    std::string summary;
    std::string description;

    bool operator==(const OpenApiEndpoint& other) const {
        return method == other.method && path == other.path &&
               operation_id == other.operation_id && summary == other.summary &&
               description == other.description;
    }
};

/// Parse an OpenAPI description, as JSON first and as YAML otherwise. Key
/// order is preserved. Format error when neither parser accepts the text.
Result<nlohmann::ordered_json, Error> LoadOpenApiDocument(std::string_view text);

/// Every (path, HTTP method) pair in document order. Keys under a path that
/// are not HTTP methods (parameters, summary, servers, $ref) are skipped.
/// Format error when "paths" is absent or not an object.
Result<std::vector<OpenApiEndpoint>, Error> ListOpenApiEndpoints(
    const nlohmann::ordered_json& document);

/// LoadOpenApiDocument followed by ListOpenApiEndpoints.
Result<std::vector<OpenApiEndpoint>, Error> ListOpenApiEndpoints(std::string_view text);

} // namespace xrdinfo
