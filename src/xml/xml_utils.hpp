#pragma once

#include <xrdinfo/core/result.hpp>

#include <tinyxml2.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo::xml_utils {

// Namespace prefixes differ between producers (SOAP-ENV:, soap:, S:, xroad:,
// none at all), so elements and attributes are matched by local name.

inline std::string_view LocalName(std::string_view qname) {
    const auto pos = qname.find(':');
    if (pos == std::string_view::npos) {
        return qname;
    }
    return qname.substr(pos + 1);
}

inline bool HasLocalName(const tinyxml2::XMLElement* element,
                         std::string_view local_name) {
    if (element == nullptr) {
        return false;
    }
    const char* name = element->Name();
    if (name == nullptr) {
        return false;
    }
    return LocalName(name) == local_name;
}

inline const tinyxml2::XMLElement* FirstChildByLocalName(
    const tinyxml2::XMLElement* parent, std::string_view local_name) {
    if (parent == nullptr) {
        return nullptr;
    }
    for (auto* child = parent->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (HasLocalName(child, local_name)) {
            return child;
        }
    }
    return nullptr;
}

inline std::vector<const tinyxml2::XMLElement*> ChildrenByLocalName(
    const tinyxml2::XMLElement* parent, std::string_view local_name) {
    std::vector<const tinyxml2::XMLElement*> out;
    if (parent == nullptr) {
        return out;
    }
    for (auto* child = parent->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (HasLocalName(child, local_name)) {
            out.push_back(child);
        }
    }
    return out;
}

/// Depth-first search for the first element with the given local name,
/// element itself included.
inline const tinyxml2::XMLElement* FindByLocalName(
    const tinyxml2::XMLElement* element, std::string_view local_name) {
    if (element == nullptr) {
        return nullptr;
    }
    if (HasLocalName(element, local_name)) {
        return element;
    }
    for (auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (auto* found = FindByLocalName(child, local_name)) {
            return found;
        }
    }
    return nullptr;
}

inline std::optional<std::string> ChildText(const tinyxml2::XMLElement* parent,
                                            std::string_view local_name) {
    const auto* child = FirstChildByLocalName(parent, local_name);
    if (child == nullptr) {
        return std::nullopt;
    }
    const char* text = child->GetText();
    return std::string(text != nullptr ? text : "");
}

inline std::string ChildTextOr(const tinyxml2::XMLElement* parent,
                               std::string_view local_name,
                               std::string default_value = "") {
    auto text = ChildText(parent, local_name);
    return text.has_value() ? *text : default_value;
}

inline std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element || !name) {
        return {};
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

/// Attribute lookup ignoring the prefix ("objectType" matches "id:objectType").
inline std::optional<std::string> AttrByLocalName(const tinyxml2::XMLElement* element,
                                                  std::string_view local_name) {
    if (element == nullptr) {
        return std::nullopt;
    }
    for (auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        if (LocalName(attr->Name()) == local_name) {
            return std::string(attr->Value());
        }
    }
    return std::nullopt;
}

inline std::optional<Error> ParseXmlOrError(tinyxml2::XMLDocument& doc,
                                            std::string_view xml,
                                            std::string_view operation,
                                            std::string_view endpoint,
                                            std::string_view context,
                                            ErrorCategory category =
                                                ErrorCategory::Format) {
    if (doc.Parse(xml.data(), xml.size()) == tinyxml2::XML_SUCCESS) {
        return std::nullopt;
    }

    std::string message(context);
    if (const char* err = doc.ErrorStr(); err != nullptr && *err != '\0') {
        message += ": ";
        message += err;
    }
    const int line = doc.ErrorLineNum();
    if (line > 0) {
        message += " (line ";
        message += std::to_string(line);
        message += ")";
    }

    return Error{
        std::string(operation),
        std::string(endpoint),
        std::nullopt,
        std::move(message),
        std::nullopt,
        category};
}

inline std::string XmlEscape(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

} // namespace xrdinfo::xml_utils
