#include <xrdinfo/meta/metadata_client.hpp>
#include <xrdinfo/core/multipart.hpp>
#include <xrdinfo/core/url.hpp>
#include "soap_envelope.hpp"
#include "../xml/identifier_xml.hpp"
#include "../xml/xml_utils.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <tinyxml2.h>

#include <cstdio>
#include <random>

namespace xrdinfo {

namespace {

constexpr const char* kComponent = "meta";
constexpr const char* kRestVersion = "r1";

using ResponseResult = Result<MetadataResponse, Error>;

Error InvalidRequest(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

Error FormatError(const std::string& operation, const std::string& endpoint,
                  std::optional<int> status, const std::string& message) {
    return Error{operation, endpoint, status, message, std::nullopt, ErrorCategory::Format};
}

bool IsProducer(const XRoadId& id) {
    return id.Type() == ObjectType::Member || id.Type() == ObjectType::Subsystem;
}

// Service identifier for the SOAP header: the producer with the metaservice
// code in place of a service.
XRoadId MetaserviceId(const XRoadId& producer, const char* service_code) {
    const auto provider = producer.ProviderId();
    return XRoadId::Service(provider.Instance(), provider.MemberClass(), provider.MemberCode(),
                            provider.SubsystemCode(), service_code)
        .Value();
}

std::string ClientHeader(const XRoadId& client) {
    return client.ToString();
}

// ---------------------------------------------------------------------------
// Response parsing
// ---------------------------------------------------------------------------

ResponseResult ParseSoapServiceList(const std::string& operation,
                                    const std::string& endpoint,
                                    const HttpResponse& response,
                                    const char* method) {
    tinyxml2::XMLDocument doc;
    auto body = soap::ParseEnvelope(doc, response.body, operation, endpoint);
    if (body.IsErr()) {
        if (!response.IsSuccess()) {
            return ResponseResult::Err(Error::FromHttpStatus(
                operation, endpoint, response.status_code, response.body));
        }
        auto error = body.Error();
        error.http_status = response.status_code;
        return ResponseResult::Err(std::move(error));
    }
    if (auto fault = soap::FindFault(body.Value())) {
        return ResponseResult::Err(Error::Fault(operation, endpoint, response.status_code,
                                                fault->fault_code, fault->fault_string));
    }
    if (!response.IsSuccess()) {
        return ResponseResult::Err(Error::FromHttpStatus(
            operation, endpoint, response.status_code, response.body));
    }

    const std::string response_name = std::string(method) + "Response";
    const auto* list = xml_utils::FindByLocalName(body.Value(), response_name);
    if (list == nullptr) {
        return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                               "Response has no " + response_name));
    }

    ServiceList services;
    for (const auto* element : xml_utils::ChildrenByLocalName(list, "service")) {
        auto id = xml_utils::ReadIdentifier(element, ObjectType::Service);
        if (id.IsErr()) {
            return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                                   "Invalid service in response: " + id.Error()));
        }
        services.services.push_back(id.Value());
    }
    return ResponseResult::Ok(MetadataResponse{std::move(services)});
}

ResponseResult ParseSoapWsdl(const std::string& operation,
                             const std::string& endpoint,
                             const HttpResponse& response) {
    // A successful answer is multipart: the envelope, then the WSDL.
    std::optional<std::string> boundary;
    if (auto content_type = FindHeader(response.headers, "Content-Type")) {
        boundary = BoundaryFromContentType(*content_type);
    }
    if (!boundary.has_value()) {
        boundary = BoundaryFromBody(response.body);
    }

    std::string envelope_text = response.body;
    std::optional<std::string> wsdl;
    if (boundary.has_value()) {
        auto parts = SplitMultipart(response.body, *boundary);
        if (parts.IsOk() && !parts.Value().empty()) {
            envelope_text = parts.Value()[0].body;
            if (parts.Value().size() > 1) {
                wsdl = parts.Value()[1].body;
            }
        }
    }

    tinyxml2::XMLDocument doc;
    auto body = soap::ParseEnvelope(doc, envelope_text, operation, endpoint);
    if (body.IsOk()) {
        if (auto fault = soap::FindFault(body.Value())) {
            return ResponseResult::Err(Error::Fault(operation, endpoint, response.status_code,
                                                    fault->fault_code, fault->fault_string));
        }
    }
    if (!response.IsSuccess()) {
        return ResponseResult::Err(Error::FromHttpStatus(
            operation, endpoint, response.status_code, response.body));
    }
    if (body.IsErr()) {
        auto error = body.Error();
        error.http_status = response.status_code;
        return ResponseResult::Err(std::move(error));
    }
    if (!wsdl.has_value() || wsdl->empty()) {
        return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                               "WSDL not found in response"));
    }
    return ResponseResult::Ok(MetadataResponse{WsdlDocument{std::move(*wsdl)}});
}

// REST error answers carry {"type": ..., "message": ...}.
std::optional<ProtocolFault> RestFault(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    auto type = parsed.find("type");
    auto message = parsed.find("message");
    if (type == parsed.end() || !type->is_string() || message == parsed.end() ||
        !message->is_string()) {
        return std::nullopt;
    }
    return ProtocolFault{type->get<std::string>(), message->get<std::string>()};
}

std::optional<Error> RestError(const std::string& operation,
                               const std::string& endpoint,
                               const HttpResponse& response) {
    if (response.IsSuccess()) {
        return std::nullopt;
    }
    if (auto fault = RestFault(response.body)) {
        const auto& text = fault->fault_string;
        const char* code = nullptr;
        const char* summary = nullptr;
        if (text == "Invalid service type: REST") {
            code = kNotOpenApiServiceFault;
            summary = "Service has no OpenAPI description";
        } else if (text.rfind("Failed reading service description from", 0) == 0) {
            code = kOpenApiReadFault;
            summary = "Failed reading the service OpenAPI description";
        }
        if (code == nullptr) {
            return Error::Fault(operation, endpoint, response.status_code, fault->fault_code,
                                text);
        }
        auto error = Error::Fault(operation, endpoint, response.status_code, code, text);
        error.message = std::string(summary) + " (" + fault->fault_code + ")";
        return error;
    }
    return Error::FromHttpStatus(operation, endpoint, response.status_code, response.body);
}

std::string JsonString(const nlohmann::json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

ResponseResult ParseRestServiceList(const std::string& operation,
                                    const std::string& endpoint,
                                    const HttpResponse& response) {
    if (auto error = RestError(operation, endpoint, response)) {
        return ResponseResult::Err(std::move(*error));
    }
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                               "Response is not a JSON object"));
    }
    auto list = parsed.find("service");
    if (list == parsed.end() || !list->is_array()) {
        return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                               "Response has no service array"));
    }

    ServiceList services;
    for (const auto& entry : *list) {
        if (!entry.is_object()) {
            return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                                   "Service entry is not an object"));
        }
        auto id = XRoadId::Service(JsonString(entry, "xroad_instance"),
                                   JsonString(entry, "member_class"),
                                   JsonString(entry, "member_code"),
                                   JsonString(entry, "subsystem_code"),
                                   JsonString(entry, "service_code"));
        if (id.IsErr()) {
            return ResponseResult::Err(FormatError(operation, endpoint, response.status_code,
                                                   "Invalid service in response: " + id.Error()));
        }
        services.services.push_back(id.Value());
    }
    return ResponseResult::Ok(MetadataResponse{std::move(services)});
}

std::string RestServicePath(const XRoadId& service) {
    return std::string("/") + kRestVersion + "/" + service.ProviderId().ToString();
}

} // anonymous namespace

const char* MetadataRequestTypeName(MetadataRequestType type) {
    switch (type) {
        case MetadataRequestType::ListMethods:    return "listMethods";
        case MetadataRequestType::AllowedMethods: return "allowedMethods";
        case MetadataRequestType::GetWsdl:        return "getWsdl";
        case MetadataRequestType::GetOpenApi:     return "getOpenAPI";
    }
    return "listMethods";
}

std::string MakeUuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        std::random_device device;
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(device());
        }
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
                  bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13],
                  bytes[14], bytes[15]);
    return out;
}

// ---------------------------------------------------------------------------
// MetadataClient
// ---------------------------------------------------------------------------

MetadataClient::MetadataClient(IHttpTransport& transport, MetadataClientOptions options)
    : transport_(transport),
      options_(std::move(options)),
      logger_(OrSilent(options_.logger)) {
    if (!options_.request_id) {
        options_.request_id = MakeUuid;
    }
}

Result<std::string, Error> MetadataClient::GatewayFor(const XRoadId& target) const {
    if (options_.gateway_url.has_value() && !options_.gateway_url->empty()) {
        return Result<std::string, Error>::Ok(
            AddUrlScheme(*options_.gateway_url, options_.use_tls));
    }
    if (!options_.shared_params) {
        return Result<std::string, Error>::Err(Error{
            "GatewayFor", target.ToString(), std::nullopt,
            "No gateway URL given and no shared parameters to look one up",
            std::nullopt, ErrorCategory::AddressResolution});
    }
    auto address = options_.shared_params->ResolveAddress(target);
    if (address.IsErr()) {
        return address;
    }
    return Result<std::string, Error>::Ok(AddUrlScheme(address.Value(), options_.use_tls));
}

Result<MetadataResponse, Error> MetadataClient::Run(const MetadataRequest& request) const {
    const std::string operation = MetadataRequestTypeName(request.type);

    if (request.client.Type() != ObjectType::Member &&
        request.client.Type() != ObjectType::Subsystem) {
        return ResponseResult::Err(InvalidRequest(
            operation, "Client must be a member or subsystem: " + request.client.ToString()));
    }
    if (!request.service.has_value()) {
        return ResponseResult::Err(InvalidRequest(operation, "A service identifier is required"));
    }
    const auto& target = *request.service;

    const bool lists_methods = request.type == MetadataRequestType::ListMethods ||
                               request.type == MetadataRequestType::AllowedMethods;
    if (lists_methods && !IsProducer(target)) {
        return ResponseResult::Err(InvalidRequest(
            operation, "Producer must be a member or subsystem: " + target.ToString()));
    }
    if (!lists_methods && target.Type() != ObjectType::Service) {
        return ResponseResult::Err(InvalidRequest(
            operation, "Target must be a service: " + target.ToString()));
    }

    auto gateway = GatewayFor(target);
    if (gateway.IsErr()) {
        auto error = gateway.Error();
        error.operation = operation;
        return ResponseResult::Err(std::move(error));
    }

    const bool rest = request.protocol == Protocol::Rest ||
                      request.type == MetadataRequestType::GetOpenApi;

    if (!rest) {
        const auto& url = gateway.Value();
        std::string body;
        XRoadId header_service = MetaserviceId(target, operation.c_str());
        if (request.type == MetadataRequestType::GetWsdl) {
            body = soap::GetWsdlBody(target);
        } else {
            body = soap::MethodsBody(operation);
        }
        const auto envelope = soap::BuildRequest(request.client, header_service,
                                                 options_.user_id, options_.request_id(), body);
        logger_->Debug(kComponent, "SOAP " + operation + " for " + target.ToString());

        auto response = transport_.Post(url, envelope, "text/xml", {}, options_.timeout);
        if (response.IsErr()) {
            auto error = response.Error();
            error.operation = operation;
            return ResponseResult::Err(std::move(error));
        }
        if (request.type == MetadataRequestType::GetWsdl) {
            return ParseSoapWsdl(operation, url, response.Value());
        }
        return ParseSoapServiceList(operation, url, response.Value(), operation.c_str());
    }

    // REST: paths are resolved against the gateway origin.
    std::string path = RestServicePath(target);
    switch (request.type) {
        case MetadataRequestType::ListMethods:
        case MetadataRequestType::AllowedMethods:
            path += "/" + operation;
            break;
        case MetadataRequestType::GetWsdl:
            path += "/getWsdl?serviceCode=" + UrlEncode(target.ServiceCode());
            if (target.ServiceVersion().has_value() && !target.ServiceVersion()->empty()) {
                path += "&version=" + UrlEncode(*target.ServiceVersion());
            }
            break;
        case MetadataRequestType::GetOpenApi:
            path += "/getOpenAPI?serviceCode=" + UrlEncode(target.ServiceCode());
            break;
    }
    const auto url = SplitUrl(gateway.Value()).Origin() + path;

    HttpHeaders headers;
    headers["X-Road-Client"] = ClientHeader(request.client);
    headers["accept"] = "application/json";
    logger_->Debug(kComponent, "REST " + operation + " for " + target.ToString());

    auto response = transport_.Get(url, headers, options_.timeout);
    if (response.IsErr()) {
        auto error = response.Error();
        error.operation = operation;
        return ResponseResult::Err(std::move(error));
    }

    if (lists_methods) {
        return ParseRestServiceList(operation, url, response.Value());
    }
    if (auto error = RestError(operation, url, response.Value())) {
        return ResponseResult::Err(std::move(*error));
    }
    if (request.type == MetadataRequestType::GetWsdl) {
        return ResponseResult::Ok(MetadataResponse{WsdlDocument{response.Value().body}});
    }
    return ResponseResult::Ok(MetadataResponse{OpenApiDocument{
        response.Value().body,
        FindHeader(response.Value().headers, "Content-Type").value_or("")}});
}

Result<MetadataResponse, Error> MetadataClient::Execute(const MetadataRequest& request) const {
    auto result = Run(request);
    if (result.IsErr()) {
        if (auto fault = result.Error().AsProtocolFault()) {
            logger_->Warn(kComponent, result.Error().ToString());
            return ResponseResult::Ok(MetadataResponse{std::move(*fault)});
        }
    }
    return result;
}

Result<std::vector<XRoadId>, Error> MetadataClient::ListMethods(const XRoadId& client,
                                                                const XRoadId& producer,
                                                                Protocol protocol) const {
    auto result = Run({MetadataRequestType::ListMethods, client, producer, protocol});
    if (result.IsErr()) {
        return Result<std::vector<XRoadId>, Error>::Err(result.Error());
    }
    return Result<std::vector<XRoadId>, Error>::Ok(
        std::get<ServiceList>(std::move(result).Value()).services);
}

Result<std::vector<XRoadId>, Error> MetadataClient::AllowedMethods(const XRoadId& client,
                                                                   const XRoadId& producer,
                                                                   Protocol protocol) const {
    auto result = Run({MetadataRequestType::AllowedMethods, client, producer, protocol});
    if (result.IsErr()) {
        return Result<std::vector<XRoadId>, Error>::Err(result.Error());
    }
    return Result<std::vector<XRoadId>, Error>::Ok(
        std::get<ServiceList>(std::move(result).Value()).services);
}

Result<WsdlDocument, Error> MetadataClient::GetWsdl(const XRoadId& client,
                                                    const XRoadId& service,
                                                    Protocol protocol) const {
    auto result = Run({MetadataRequestType::GetWsdl, client, service, protocol});
    if (result.IsErr()) {
        return Result<WsdlDocument, Error>::Err(result.Error());
    }
    return Result<WsdlDocument, Error>::Ok(std::get<WsdlDocument>(std::move(result).Value()));
}

Result<OpenApiDocument, Error> MetadataClient::GetOpenApi(const XRoadId& client,
                                                          const XRoadId& service) const {
    auto result = Run({MetadataRequestType::GetOpenApi, client, service, Protocol::Rest});
    if (result.IsErr()) {
        return Result<OpenApiDocument, Error>::Err(result.Error());
    }
    return Result<OpenApiDocument, Error>::Ok(
        std::get<OpenApiDocument>(std::move(result).Value()));
}

} // namespace xrdinfo
