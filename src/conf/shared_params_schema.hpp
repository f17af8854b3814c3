#pragma once

#include <xrdinfo/conf/shared_params.hpp>
#include "../xml/identifier_xml.hpp"

#include <tinyxml2.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xrdinfo::shared_params_schema {

// ---------------------------------------------------------------------------
// Document dialects of shared-parameters, selected by the part's Version
// header. Each exposes the same extraction interface; elements a dialect
// does not define yield nothing.
// ---------------------------------------------------------------------------

inline Result<std::vector<CentralService>, std::string> ReadCentralServiceElements(
    const tinyxml2::XMLElement* root) {
    std::vector<CentralService> out;
    for (const auto* element : xml_utils::ChildrenByLocalName(root, "centralService")) {
        CentralService service;
        service.service_code = xml_utils::ChildTextOr(element, "serviceCode");
        if (service.service_code.empty()) {
            return Result<std::vector<CentralService>, std::string>::Err(
                "centralService without serviceCode");
        }
        if (const auto* impl = xml_utils::FirstChildByLocalName(element, "implementingService")) {
            auto id = xml_utils::ReadIdentifier(impl, ObjectType::Service);
            if (id.IsErr()) {
                return Result<std::vector<CentralService>, std::string>::Err(
                    "centralService " + service.service_code + ": " + id.Error());
            }
            service.implementing_service = id.Value();
        }
        out.push_back(std::move(service));
    }
    return Result<std::vector<CentralService>, std::string>::Ok(std::move(out));
}

struct SchemaV2 {
    static constexpr int kVersion = 2;

    Result<std::vector<CentralService>, std::string> CentralServices(
        const tinyxml2::XMLElement* root) const {
        return ReadCentralServiceElements(root);
    }
};

// X-Road 7 and later: central services were removed from the document.
struct SchemaV3 {
    static constexpr int kVersion = 3;

    Result<std::vector<CentralService>, std::string> CentralServices(
        const tinyxml2::XMLElement*) const {
        return Result<std::vector<CentralService>, std::string>::Ok(
            std::vector<CentralService>{});
    }
};

using Schema = std::variant<SchemaV2, SchemaV3>;

/// Dialect for a Version header value; absent or unparseable means 2.
inline Schema ForVersion(const std::optional<std::string>& version) {
    if (!version.has_value()) {
        return SchemaV2{};
    }
    int number = 0;
    for (char c : *version) {
        if (c < '0' || c > '9') {
            return SchemaV2{};
        }
        number = number * 10 + (c - '0');
        if (number > 1000) break;
    }
    return number >= 3 ? Schema{SchemaV3{}} : Schema{SchemaV2{}};
}

inline int VersionOf(const Schema& schema) {
    return std::visit([](const auto& dialect) { return dialect.kVersion; }, schema);
}

} // namespace xrdinfo::shared_params_schema
