#include <xrdinfo/meta/openapi.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace xrdinfo {

namespace {

constexpr std::array<const char*, 8> kHttpMethods = {
    "get", "put", "post", "delete", "options", "head", "patch", "trace"};

Error OpenApiError(const std::string& message) {
    return Error{"OpenApi", "", std::nullopt, message, std::nullopt, ErrorCategory::Format};
}

bool IsHttpMethod(const std::string& key) {
    return std::any_of(kHttpMethods.begin(), kHttpMethods.end(),
                       [&](const char* method) { return key == method; });
}

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string StringMember(const nlohmann::ordered_json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

using JsonResult = Result<nlohmann::ordered_json, Error>;

// Mapping keys must be scalars: JSON has no complex keys.
JsonResult FromYaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            auto object = nlohmann::ordered_json::object();
            for (const auto& item : node) {
                if (!item.first.IsScalar()) {
                    return JsonResult::Err(OpenApiError(
                        "OpenAPI description has a non-scalar mapping key at line " +
                        std::to_string(item.first.Mark().line + 1)));
                }
                auto value = FromYaml(item.second);
                if (value.IsErr()) {
                    return value;
                }
                object[item.first.Scalar()] = std::move(value).Value();
            }
            return JsonResult::Ok(std::move(object));
        }
        case YAML::NodeType::Sequence: {
            auto array = nlohmann::ordered_json::array();
            for (const auto& item : node) {
                auto value = FromYaml(item);
                if (value.IsErr()) {
                    return value;
                }
                array.push_back(std::move(value).Value());
            }
            return JsonResult::Ok(std::move(array));
        }
        case YAML::NodeType::Scalar:
            return JsonResult::Ok(nlohmann::ordered_json(node.Scalar()));
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return JsonResult::Ok(nlohmann::ordered_json(nullptr));
}

} // anonymous namespace

Result<nlohmann::ordered_json, Error> LoadOpenApiDocument(std::string_view text) {
    auto json = nlohmann::ordered_json::parse(text.begin(), text.end(), nullptr, false);
    if (!json.is_discarded()) {
        return Result<nlohmann::ordered_json, Error>::Ok(std::move(json));
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Result<nlohmann::ordered_json, Error>::Err(
            OpenApiError("Can not parse OpenAPI description: " + std::string(e.what())));
    }
    if (!root.IsMap()) {
        return Result<nlohmann::ordered_json, Error>::Err(
            OpenApiError("OpenAPI description is not a mapping"));
    }
    return FromYaml(root);
}

Result<std::vector<OpenApiEndpoint>, Error> ListOpenApiEndpoints(
    const nlohmann::ordered_json& document) {
    if (!document.is_object()) {
        return Result<std::vector<OpenApiEndpoint>, Error>::Err(
            OpenApiError("OpenAPI description is not an object"));
    }
    auto paths = document.find("paths");
    if (paths == document.end()) {
        return Result<std::vector<OpenApiEndpoint>, Error>::Err(
            OpenApiError("OpenAPI description has no paths"));
    }
    if (!paths->is_object()) {
        return Result<std::vector<OpenApiEndpoint>, Error>::Err(
            OpenApiError("OpenAPI paths is not an object"));
    }

    std::vector<OpenApiEndpoint> endpoints;
    for (const auto& [path, item] : paths->items()) {
        if (item.is_null()) {
            continue;
        }
        if (!item.is_object()) {
            return Result<std::vector<OpenApiEndpoint>, Error>::Err(
                OpenApiError("Path item '" + path + "' is not an object"));
        }
        for (const auto& [key, operation] : item.items()) {
            if (!IsHttpMethod(key)) {
                continue;
            }
            endpoints.push_back(OpenApiEndpoint{
                ToUpper(key),
                path,
                StringMember(operation, "operationId"),
                StringMember(operation, "summary"),
                StringMember(operation, "description"),
            });
        }
    }
    return Result<std::vector<OpenApiEndpoint>, Error>::Ok(std::move(endpoints));
}

Result<std::vector<OpenApiEndpoint>, Error> ListOpenApiEndpoints(std::string_view text) {
    auto document = LoadOpenApiDocument(text);
    if (document.IsErr()) {
        return Result<std::vector<OpenApiEndpoint>, Error>::Err(document.Error());
    }
    return ListOpenApiEndpoints(document.Value());
}

} // namespace xrdinfo
