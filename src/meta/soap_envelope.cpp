#include "soap_envelope.hpp"
#include "../xml/xml_utils.hpp"

#include <cctype>

namespace xrdinfo::soap {

namespace {

std::string IdTag(std::string_view local, const std::string& value) {
    const std::string name = "id:" + std::string(local);
    return "<" + name + ">" + xml_utils::XmlEscape(value) + "</" + name + ">";
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

std::string IdentifierXml(std::string_view element, const XRoadId& id) {
    const std::string name = "xroad:" + std::string(element);
    std::string xml = "<" + name + R"( id:objectType=")" + ObjectTypeName(id.Type()) + R"(">)";
    xml += IdTag("xRoadInstance", id.Instance());
    xml += IdTag("memberClass", id.MemberClass());
    xml += IdTag("memberCode", id.MemberCode());
    switch (id.Type()) {
        case ObjectType::Member:
            break;
        case ObjectType::Subsystem:
            xml += IdTag("subsystemCode", id.SubsystemCode());
            break;
        case ObjectType::Service:
            if (!id.SubsystemCode().empty()) {
                xml += IdTag("subsystemCode", id.SubsystemCode());
            }
            xml += IdTag("serviceCode", id.ServiceCode());
            if (id.ServiceVersion().has_value() && !id.ServiceVersion()->empty()) {
                xml += IdTag("serviceVersion", *id.ServiceVersion());
            }
            break;
        case ObjectType::Server:
            xml += IdTag("serverCode", id.ServerCode());
            break;
    }
    xml += "</" + name + ">";
    return xml;
}

std::string BuildRequest(const XRoadId& client,
                         const XRoadId& service,
                         const std::string& user_id,
                         const std::string& request_id,
                         const std::string& body_xml) {
    std::string xml = R"(<?xml version="1.0" encoding="utf-8"?>)";
    xml += "\n";
    xml += R"(<SOAP-ENV:Envelope xmlns:SOAP-ENV=")" + std::string(kSoapEnvNs) + R"(")";
    xml += R"( xmlns:xroad=")" + std::string(kXroadNs) + R"(")";
    xml += R"( xmlns:id=")" + std::string(kIdentifiersNs) + R"(">)";
    xml += "<SOAP-ENV:Header>";
    xml += IdentifierXml("client", client);
    xml += IdentifierXml("service", service);
    if (!user_id.empty()) {
        xml += "<xroad:userId>" + xml_utils::XmlEscape(user_id) + "</xroad:userId>";
    }
    xml += "<xroad:id>" + xml_utils::XmlEscape(request_id) + "</xroad:id>";
    xml += "<xroad:protocolVersion>" + std::string(kProtocolVersion) +
           "</xroad:protocolVersion>";
    xml += "</SOAP-ENV:Header>";
    xml += "<SOAP-ENV:Body>" + body_xml + "</SOAP-ENV:Body>";
    xml += "</SOAP-ENV:Envelope>";
    return xml;
}

std::string MethodsBody(std::string_view method) {
    return "<xroad:" + std::string(method) + "/>";
}

std::string GetWsdlBody(const XRoadId& service) {
    std::string xml = "<xroad:getWsdl>";
    xml += "<xroad:serviceCode>" + xml_utils::XmlEscape(service.ServiceCode()) +
           "</xroad:serviceCode>";
    if (service.ServiceVersion().has_value() && !service.ServiceVersion()->empty()) {
        xml += "<xroad:serviceVersion>" + xml_utils::XmlEscape(*service.ServiceVersion()) +
               "</xroad:serviceVersion>";
    }
    xml += "</xroad:getWsdl>";
    return xml;
}

std::optional<std::string_view> ExtractEnvelope(std::string_view text) {
    size_t start = std::string_view::npos;
    size_t search_from = 0;
    while (start == std::string_view::npos) {
        const auto pos = text.find("Envelope", search_from);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        search_from = pos + 1;

        // Walk back over an optional "prefix:" to the opening '<'.
        size_t open = pos;
        if (open > 0 && text[open - 1] == ':') {
            --open;
            while (open > 0 && IsNameChar(text[open - 1])) {
                --open;
            }
        }
        const size_t after = pos + 8;
        if (open > 0 && text[open - 1] == '<' && after < text.size() &&
            (text[after] == '>' || std::isspace(static_cast<unsigned char>(text[after])))) {
            start = open - 1;
        }
    }

    const auto close = text.rfind("Envelope>");
    if (close == std::string_view::npos || close < start) {
        return std::nullopt;
    }
    return text.substr(start, close + 9 - start);
}

Result<const tinyxml2::XMLElement*, Error> ParseEnvelope(tinyxml2::XMLDocument& doc,
                                                         std::string_view text,
                                                         const std::string& operation,
                                                         const std::string& endpoint) {
    auto envelope = ExtractEnvelope(text);
    if (!envelope.has_value()) {
        return Result<const tinyxml2::XMLElement*, Error>::Err(Error{
            operation, endpoint, std::nullopt, "SOAP envelope was not found in response",
            std::nullopt, ErrorCategory::Format});
    }
    // Namespace declarations may sit outside the extracted text; tinyxml2
    // does not resolve namespaces, so the envelope parses on its own.
    if (auto parse_error = xml_utils::ParseXmlOrError(
            doc, *envelope, operation, endpoint, "Received incorrect SOAP response")) {
        return Result<const tinyxml2::XMLElement*, Error>::Err(std::move(*parse_error));
    }
    const auto* body = xml_utils::FirstChildByLocalName(doc.RootElement(), "Body");
    if (body == nullptr) {
        return Result<const tinyxml2::XMLElement*, Error>::Err(Error{
            operation, endpoint, std::nullopt, "SOAP envelope has no Body", std::nullopt,
            ErrorCategory::Format});
    }
    return Result<const tinyxml2::XMLElement*, Error>::Ok(body);
}

std::optional<ProtocolFault> FindFault(const tinyxml2::XMLElement* body) {
    const auto* fault = xml_utils::FirstChildByLocalName(body, "Fault");
    if (fault == nullptr) {
        return std::nullopt;
    }
    return ProtocolFault{xml_utils::ChildTextOr(fault, "faultcode"),
                         xml_utils::ChildTextOr(fault, "faultstring")};
}

} // namespace xrdinfo::soap
