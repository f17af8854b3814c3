#pragma once

#include <xrdinfo/conf/shared_params.hpp>
#include <xrdinfo/core/identifier.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/result.hpp>
#include <xrdinfo/http/i_http_transport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xrdinfo {

enum class MetadataRequestType {
    ListMethods,
    AllowedMethods,
    GetWsdl,
    GetOpenApi,
};

enum class Protocol {
    Soap,
    Rest,
};

[[nodiscard]] const char* MetadataRequestTypeName(MetadataRequestType type);

// ---------------------------------------------------------------------------
// MetadataRequest — one metaservice call.
//
// For ListMethods/AllowedMethods, service names the producer (member or
// subsystem) whose services are listed. GetWsdl and GetOpenApi require a
// service identifier. GetOpenApi is a REST metaservice and ignores protocol.
// ---------------------------------------------------------------------------
struct MetadataRequest {
    MetadataRequestType type;
    XRoadId client;
    std::optional<XRoadId> service;
    Protocol protocol = Protocol::Soap;
};

struct ServiceList {
    std::vector<XRoadId> services;
};

struct WsdlDocument {
    std::string content;
};

struct OpenApiDocument {
    std::string content;
    std::string content_type;
};

using MetadataResponse = std::variant<ServiceList, WsdlDocument, OpenApiDocument, ProtocolFault>;

// Fault codes given to the two REST errors a security server returns for
// getOpenAPI: the service is not a REST service with an OpenAPI description,
// or its description could not be read. fault_string keeps the remote
// message; the remote type is appended to Error::message.
inline constexpr const char* kNotOpenApiServiceFault = "NotOpenApiService";
inline constexpr const char* kOpenApiReadFault = "OpenApiReadError";

struct MetadataClientOptions {
    // Gateway to send requests to, usually the caller's own security server.
    // When unset the gateway of the target is looked up in shared_params.
    std::optional<std::string> gateway_url;
    std::shared_ptr<const SharedParams> shared_params;
    // Prefix https:// rather than http:// to gateway addresses without a
    // scheme (set when TLS material or CA verification is configured).
    bool use_tls = false;
    std::chrono::milliseconds timeout{5000};
    std::string user_id = "xrdinfo";
    // Message id for SOAP requests; defaults to a random UUID.
    std::function<std::string()> request_id;
    std::shared_ptr<Logger> logger;
};

// ---------------------------------------------------------------------------
// MetadataClient — builds, sends and parses metaservice requests.
//
// Each call issues exactly one HTTP request; nothing is retried. A remote
// fault (SOAP Fault, REST error body, or an error status) is reported as a
// ProtocolFault with the remote text untouched. Execute folds faults into
// the response variant; the typed helpers return them as errors.
// ---------------------------------------------------------------------------
class MetadataClient {
public:
    explicit MetadataClient(IHttpTransport& transport, MetadataClientOptions options = {});

    [[nodiscard]] Result<MetadataResponse, Error> Execute(const MetadataRequest& request) const;

    [[nodiscard]] Result<std::vector<XRoadId>, Error> ListMethods(
        const XRoadId& client, const XRoadId& producer,
        Protocol protocol = Protocol::Soap) const;

    [[nodiscard]] Result<std::vector<XRoadId>, Error> AllowedMethods(
        const XRoadId& client, const XRoadId& producer,
        Protocol protocol = Protocol::Soap) const;

    [[nodiscard]] Result<WsdlDocument, Error> GetWsdl(
        const XRoadId& client, const XRoadId& service,
        Protocol protocol = Protocol::Soap) const;

    [[nodiscard]] Result<OpenApiDocument, Error> GetOpenApi(
        const XRoadId& client, const XRoadId& service) const;

    /// Gateway URL used for a request to target, scheme included.
    [[nodiscard]] Result<std::string, Error> GatewayFor(const XRoadId& target) const;

private:
    [[nodiscard]] Result<MetadataResponse, Error> Run(const MetadataRequest& request) const;

    IHttpTransport& transport_;
    MetadataClientOptions options_;
    std::shared_ptr<Logger> logger_;
};

/// Random (version 4) UUID in canonical form.
std::string MakeUuid();

} // namespace xrdinfo
