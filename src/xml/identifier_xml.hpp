#pragma once

#include <xrdinfo/core/identifier.hpp>
#include "xml_utils.hpp"

#include <tinyxml2.h>

#include <string>

namespace xrdinfo::xml_utils {

// Read an identifier element such as
//   <xroad:service id:objectType="SERVICE">
//     <id:xRoadInstance>EE</id:xRoadInstance> ... </xroad:service>
// The type comes from the objectType attribute, or from fallback_type when
// the element has none. subsystemCode and serviceVersion may be absent.
inline Result<XRoadId, std::string> ReadIdentifier(const tinyxml2::XMLElement* element,
                                                   ObjectType fallback_type) {
    if (element == nullptr) {
        return Result<XRoadId, std::string>::Err("identifier element missing");
    }

    ObjectType type = fallback_type;
    if (auto attr = AttrByLocalName(element, "objectType")) {
        if (*attr == "MEMBER") {
            type = ObjectType::Member;
        } else if (*attr == "SUBSYSTEM") {
            type = ObjectType::Subsystem;
        } else if (*attr == "SERVICE") {
            type = ObjectType::Service;
        } else if (*attr == "SERVER") {
            type = ObjectType::Server;
        } else {
            return Result<XRoadId, std::string>::Err("unsupported objectType '" + *attr + "'");
        }
    }

    const auto instance = ChildTextOr(element, "xRoadInstance");
    const auto member_class = ChildTextOr(element, "memberClass");
    const auto member_code = ChildTextOr(element, "memberCode");
    switch (type) {
        case ObjectType::Member:
            return XRoadId::Member(instance, member_class, member_code);
        case ObjectType::Subsystem:
            return XRoadId::Subsystem(instance, member_class, member_code,
                                      ChildTextOr(element, "subsystemCode"));
        case ObjectType::Service:
            return XRoadId::Service(instance, member_class, member_code,
                                    ChildTextOr(element, "subsystemCode"),
                                    ChildTextOr(element, "serviceCode"),
                                    ChildText(element, "serviceVersion"));
        case ObjectType::Server:
            return XRoadId::Server(instance, member_class, member_code,
                                   ChildTextOr(element, "serverCode"));
    }
    return Result<XRoadId, std::string>::Err("unsupported objectType");
}

} // namespace xrdinfo::xml_utils
