#pragma once

#include <xrdinfo/core/identifier.hpp>
#include <xrdinfo/core/result.hpp>

#include <tinyxml2.h>

#include <optional>
#include <string>
#include <string_view>

namespace xrdinfo::soap {

constexpr const char* kSoapEnvNs = "http://schemas.xmlsoap.org/soap/envelope/";
constexpr const char* kXroadNs = "http://x-road.eu/xsd/xroad.xsd";
constexpr const char* kIdentifiersNs = "http://x-road.eu/xsd/identifiers";
constexpr const char* kProtocolVersion = "4.0";

/// <xroad:{element} id:objectType="..."> with the identifier's segments.
/// Empty subsystem codes and absent versions are left out.
std::string IdentifierXml(std::string_view element, const XRoadId& id);

/// Full request envelope around body_xml.
std::string BuildRequest(const XRoadId& client,
                         const XRoadId& service,
                         const std::string& user_id,
                         const std::string& request_id,
                         const std::string& body_xml);

/// <xroad:listMethods/> or <xroad:allowedMethods/>.
std::string MethodsBody(std::string_view method);

/// <xroad:getWsdl> naming the service code and, if any, version.
std::string GetWsdlBody(const XRoadId& service);

/// The Envelope element text within a response that may carry MIME framing
/// or leading bytes; any namespace prefix is accepted.
std::optional<std::string_view> ExtractEnvelope(std::string_view text);

/// Parse an envelope and return its Body element. Format error when the
/// text holds no parseable envelope or the envelope has no Body.
Result<const tinyxml2::XMLElement*, Error> ParseEnvelope(tinyxml2::XMLDocument& doc,
                                                         std::string_view text,
                                                         const std::string& operation,
                                                         const std::string& endpoint);

/// The Fault in a Body, faultcode and faultstring verbatim.
std::optional<ProtocolFault> FindFault(const tinyxml2::XMLElement* body);

} // namespace xrdinfo::soap
