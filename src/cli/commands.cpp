#include <xrdinfo/cli/commands.hpp>

#include <xrdinfo/conf/configuration_anchor.hpp>
#include <xrdinfo/conf/global_conf.hpp>
#include <xrdinfo/conf/verification_conf.hpp>
#include <xrdinfo/meta/metadata_client.hpp>
#include <xrdinfo/meta/openapi.hpp>
#include <xrdinfo/meta/wsdl.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace xrdinfo {

namespace {

using VoidResult = Result<void, Error>;

constexpr const char* kComponent = "cli";

Error UsageError(const std::string& command, const std::string& message) {
    return Error{command, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

std::chrono::milliseconds Timeout(const AppConfig& config) {
    return std::chrono::ceil<std::chrono::milliseconds>(
        std::chrono::duration<double>(config.TimeoutSeconds()));
}

nlohmann::json OptionalJson(const std::optional<std::string>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

nlohmann::json IdJson(const XRoadId& id) {
    return nlohmann::json{{"type", ObjectTypeName(id.Type())},
                          {"id", id.ToString()},
                          {"parts", id.Parts()}};
}

// ---------------------------------------------------------------------------
// Configuration loading shared by the configuration-backed commands.
// ---------------------------------------------------------------------------

Result<GlobalConfiguration, Error> LoadConfiguration(const CommandContext& ctx) {
    const auto& config = ctx.config;
    if (!config.anchor.has_value()) {
        return Result<GlobalConfiguration, Error>::Err(UsageError(
            config.command, "No configuration anchor given (--anchor or 'anchor' in config)"));
    }

    auto anchor = ConfigurationAnchor::LoadFile(*config.anchor);
    if (anchor.IsErr()) {
        return Result<GlobalConfiguration, Error>::Err(anchor.Error());
    }
    if (config.instance.has_value() &&
        *config.instance != anchor.Value().InstanceIdentifier()) {
        return Result<GlobalConfiguration, Error>::Err(UsageError(
            config.command, "Anchor is for instance '" + anchor.Value().InstanceIdentifier() +
                                "', expected '" + *config.instance + "'"));
    }

    LoadOptions options;
    options.timeout = Timeout(config);
    options.clock = ctx.clock;
    options.logger = ctx.logger;
    return LoadGlobalConfiguration(ctx.transport, anchor.Value(), options);
}

// Shared parameters from the anchor's configuration source or, without an
// anchor, from the security server's verificationconf archive.
Result<SharedParams, Error> LoadSharedParams(const CommandContext& ctx) {
    const auto& config = ctx.config;
    if (!config.anchor.has_value() && !config.security_server.has_value()) {
        return Result<SharedParams, Error>::Err(
            UsageError(config.command, "No configuration source given (--anchor or "
                                       "--security-server)"));
    }
    if (config.anchor.has_value()) {
        auto conf = LoadConfiguration(ctx);
        if (conf.IsErr()) {
            return Result<SharedParams, Error>::Err(conf.Error());
        }
        return Result<SharedParams, Error>::Ok(std::move(conf).Value().shared_params);
    }

    SecurityServerLoadOptions options;
    options.timeout = Timeout(config);
    options.instance = config.instance;
    options.use_tls = config.tls.cert.has_value() || config.tls.ca.has_value();
    options.logger = ctx.logger;
    return LoadSharedParamsFromSecurityServer(ctx.transport, *config.security_server, options);
}

Result<XRoadId, Error> ParseArgumentId(const CommandContext& ctx, const std::string& what) {
    const auto& config = ctx.config;
    if (config.arguments.size() != 1) {
        return Result<XRoadId, Error>::Err(
            UsageError(config.command, "Expected exactly one " + what + " identifier"));
    }
    auto id = XRoadId::Parse(config.arguments.front());
    if (id.IsErr()) {
        return Result<XRoadId, Error>::Err(UsageError(
            config.command, "Invalid " + what + " identifier '" + config.arguments.front() +
                                "': " + id.Error()));
    }
    return Result<XRoadId, Error>::Ok(std::move(id).Value());
}

Result<XRoadId, Error> ParseClientId(const CommandContext& ctx) {
    const auto& config = ctx.config;
    if (!config.client.has_value()) {
        return Result<XRoadId, Error>::Err(
            UsageError(config.command, "No client given (--client or 'client' in config)"));
    }
    auto id = XRoadId::Parse(*config.client);
    if (id.IsErr()) {
        return Result<XRoadId, Error>::Err(UsageError(
            config.command, "Invalid client identifier '" + *config.client + "': " + id.Error()));
    }
    return Result<XRoadId, Error>::Ok(std::move(id).Value());
}

// A metadata client for the configured security server. Without one, the
// target's own server is looked up in the global configuration.
Result<MetadataClient, Error> MakeMetadataClient(const CommandContext& ctx) {
    const auto& config = ctx.config;

    MetadataClientOptions options;
    options.gateway_url = config.security_server;
    options.use_tls = config.tls.cert.has_value() || config.tls.ca.has_value();
    options.timeout = Timeout(config);
    options.user_id = config.UserId();
    options.logger = ctx.logger;

    if (!config.security_server.has_value()) {
        auto conf = LoadConfiguration(ctx);
        if (conf.IsErr()) {
            return Result<MetadataClient, Error>::Err(conf.Error());
        }
        options.shared_params =
            std::make_shared<const SharedParams>(std::move(conf).Value().shared_params);
    }
    return Result<MetadataClient, Error>::Ok(MetadataClient(ctx.transport, std::move(options)));
}

Protocol ProtocolOf(const AppConfig& config) {
    return config.rest ? Protocol::Rest : Protocol::Soap;
}

// ---------------------------------------------------------------------------
// Configuration commands
// ---------------------------------------------------------------------------

VoidResult RunMembers(const CommandContext& ctx) {
    auto params_result = LoadSharedParams(ctx);
    if (params_result.IsErr()) {
        return VoidResult::Err(params_result.Error());
    }
    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& member : params_result.Value().Members()) {
        auto parts = member.id.Parts();
        if (member.name.has_value()) {
            parts.push_back(*member.name);
        }
        lines.push_back(JoinIdentifier(parts));
        json.push_back({{"id", member.id.ToString()},
                        {"member_class", member.member_class},
                        {"member_code", member.member_code},
                        {"name", OptionalJson(member.name)}});
    }
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

VoidResult RunSubsystems(const CommandContext& ctx) {
    const auto& flags = ctx.config.flags;
    if (flags.with_name && flags.with_server) {
        return VoidResult::Err(UsageError(ctx.config.command,
                                          "--with-name and --with-server are exclusive"));
    }
    auto params_result = LoadSharedParams(ctx);
    if (params_result.IsErr()) {
        return VoidResult::Err(params_result.Error());
    }
    const auto& params = params_result.Value();

    std::vector<std::string> lines;
    auto json = nlohmann::json::array();

    if (flags.with_name) {
        for (const auto& row : params.SubsystemsWithMemberName()) {
            auto parts = row.subsystem.id.Parts();
            parts.push_back(row.member_name.value_or(""));
            lines.push_back(JoinIdentifier(parts));
            json.push_back({{"id", row.subsystem.id.ToString()},
                            {"member_name", OptionalJson(row.member_name)}});
        }
    } else if (flags.with_server) {
        for (const auto& row : params.SubsystemsWithServer()) {
            if (flags.registered && !row.server.has_value()) {
                continue;
            }
            if (!row.server.has_value()) {
                lines.push_back(row.subsystem.id.ToString() + " NOSERVER");
                json.push_back({{"id", row.subsystem.id.ToString()}, {"server", nullptr}});
                continue;
            }
            auto parts = row.subsystem.id.Parts();
            const auto& server = row.server->id;
            parts.push_back(server.MemberClass());
            parts.push_back(server.MemberCode());
            parts.push_back(server.ServerCode());
            lines.push_back(JoinIdentifier(parts));
            json.push_back({{"id", row.subsystem.id.ToString()},
                            {"server", server.ToString()},
                            {"address", OptionalJson(row.server->address)}});
        }
    } else {
        const auto subsystems =
            flags.registered ? params.RegisteredSubsystems() : params.Subsystems();
        for (const auto& subsystem : subsystems) {
            lines.push_back(subsystem.id.ToString());
            json.push_back(IdJson(subsystem.id));
        }
    }

    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

VoidResult RunServers(const CommandContext& ctx) {
    auto params_result = LoadSharedParams(ctx);
    if (params_result.IsErr()) {
        return VoidResult::Err(params_result.Error());
    }
    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& server : params_result.Value().SecurityServers()) {
        lines.push_back(JoinIdentifier({server.id.Instance(), server.owner_id.MemberClass(),
                                        server.owner_id.MemberCode(), server.server_code,
                                        server.address.value_or("")}));
        std::vector<std::string> clients;
        for (const auto& client : server.clients) {
            clients.push_back(client.ToString());
        }
        json.push_back({{"id", server.id.ToString()},
                        {"owner", server.owner_id.ToString()},
                        {"address", OptionalJson(server.address)},
                        {"clients", clients}});
    }
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

VoidResult RunServerIps(const CommandContext& ctx) {
    auto params_result = LoadSharedParams(ctx);
    if (params_result.IsErr()) {
        return VoidResult::Err(params_result.Error());
    }
    const auto ips = ctx.resolver ? ListServerIps(params_result.Value(), ctx.resolver)
                                  : ListServerIps(params_result.Value());
    ctx.output.PrintRecords(ips, nlohmann::json(ips));
    return VoidResult::Ok();
}

VoidResult RunGroups(const CommandContext& ctx) {
    auto params_result = LoadSharedParams(ctx);
    if (params_result.IsErr()) {
        return VoidResult::Err(params_result.Error());
    }
    const auto& params = params_result.Value();
    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& group : params.GlobalGroups()) {
        std::vector<std::string> parts{params.Instance(), group.group_code};
        if (group.description.has_value()) {
            parts.push_back(*group.description);
        }
        lines.push_back(JoinIdentifier(parts));
        std::vector<std::string> members;
        for (const auto& member : group.members) {
            members.push_back(member.ToString());
        }
        json.push_back({{"group_code", group.group_code},
                        {"description", OptionalJson(group.description)},
                        {"members", members}});
    }
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

VoidResult RunCentralServices(const CommandContext& ctx) {
    auto params_result = LoadSharedParams(ctx);
    if (params_result.IsErr()) {
        return VoidResult::Err(params_result.Error());
    }
    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& service : params_result.Value().CentralServices()) {
        std::string line = service.service_code;
        nlohmann::json implementing = nullptr;
        if (service.implementing_service.has_value()) {
            line += " " + service.implementing_service->ToString();
            implementing = service.implementing_service->ToString();
        }
        lines.push_back(std::move(line));
        json.push_back({{"service_code", service.service_code},
                        {"implementing_service", implementing}});
    }
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

VoidResult RunConfStatus(const CommandContext& ctx) {
    auto conf = LoadConfiguration(ctx);
    if (conf.IsErr()) {
        return VoidResult::Err(conf.Error());
    }
    const auto& loaded = conf.Value();

    std::vector<std::string> lines;
    lines.push_back("source: " + loaded.source_url);
    lines.push_back("instance: " + loaded.shared_params.Instance());
    lines.push_back("stale: " + std::string(loaded.stale ? "yes" : "no"));

    auto parts_json = nlohmann::json::array();
    for (const auto& verified : loaded.parts) {
        const auto& part = verified.Part();
        const std::string expires =
            part.expiration.has_value() ? FormatIso8601(*part.expiration) : "";
        std::string line = "part: " + part.content_identifier + " " + part.instance;
        if (part.version.has_value()) {
            line += " version=" + *part.version;
        }
        if (!expires.empty()) {
            line += " expires=" + expires;
        }
        if (verified.Stale()) {
            line += " STALE";
        }
        lines.push_back(std::move(line));
        parts_json.push_back({{"content_identifier", part.content_identifier},
                              {"instance", part.instance},
                              {"location", part.location},
                              {"version", OptionalJson(part.version)},
                              {"expires", expires.empty() ? nlohmann::json(nullptr)
                                                          : nlohmann::json(expires)},
                              {"stale", verified.Stale()}});
    }

    ctx.output.PrintRecords(lines, nlohmann::json{{"source", loaded.source_url},
                                                  {"instance", loaded.shared_params.Instance()},
                                                  {"stale", loaded.stale},
                                                  {"parts", parts_json}});
    return VoidResult::Ok();
}

// ---------------------------------------------------------------------------
// Metaservice commands
// ---------------------------------------------------------------------------

VoidResult RunMethods(const CommandContext& ctx) {
    auto client = ParseClientId(ctx);
    if (client.IsErr()) {
        return VoidResult::Err(client.Error());
    }
    auto producer = ParseArgumentId(ctx, "producer");
    if (producer.IsErr()) {
        return VoidResult::Err(producer.Error());
    }
    auto metadata = MakeMetadataClient(ctx);
    if (metadata.IsErr()) {
        return VoidResult::Err(metadata.Error());
    }

    const auto protocol = ProtocolOf(ctx.config);
    auto services = ctx.config.flags.allowed
                        ? metadata.Value().AllowedMethods(client.Value(), producer.Value(), protocol)
                        : metadata.Value().ListMethods(client.Value(), producer.Value(), protocol);
    if (services.IsErr()) {
        return VoidResult::Err(services.Error());
    }

    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& service : services.Value()) {
        lines.push_back(service.ToString());
        json.push_back(IdJson(service));
    }
    OrSilent(ctx.logger)->Info(kComponent, std::to_string(lines.size()) + " service(s) from " +
                                     producer.Value().ToString());
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

Result<WsdlDocument, Error> FetchWsdl(const CommandContext& ctx) {
    auto client = ParseClientId(ctx);
    if (client.IsErr()) {
        return Result<WsdlDocument, Error>::Err(client.Error());
    }
    auto service = ParseArgumentId(ctx, "service");
    if (service.IsErr()) {
        return Result<WsdlDocument, Error>::Err(service.Error());
    }
    auto metadata = MakeMetadataClient(ctx);
    if (metadata.IsErr()) {
        return Result<WsdlDocument, Error>::Err(metadata.Error());
    }
    return metadata.Value().GetWsdl(client.Value(), service.Value(), ProtocolOf(ctx.config));
}

VoidResult RunWsdl(const CommandContext& ctx) {
    auto wsdl = FetchWsdl(ctx);
    if (wsdl.IsErr()) {
        return VoidResult::Err(wsdl.Error());
    }
    ctx.output.PrintDocument(wsdl.Value().content);
    return VoidResult::Ok();
}

VoidResult RunWsdlOperations(const CommandContext& ctx) {
    auto wsdl = FetchWsdl(ctx);
    if (wsdl.IsErr()) {
        return VoidResult::Err(wsdl.Error());
    }
    auto operations = ListWsdlOperations(wsdl.Value().content);
    if (operations.IsErr()) {
        return VoidResult::Err(operations.Error());
    }

    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& operation : operations.Value()) {
        lines.push_back(operation.version.empty() ? operation.name
                                                  : operation.name + " " + operation.version);
        json.push_back({{"name", operation.name}, {"version", operation.version}});
    }
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

VoidResult RunOpenApi(const CommandContext& ctx) {
    auto client = ParseClientId(ctx);
    if (client.IsErr()) {
        return VoidResult::Err(client.Error());
    }
    auto service = ParseArgumentId(ctx, "service");
    if (service.IsErr()) {
        return VoidResult::Err(service.Error());
    }
    auto metadata = MakeMetadataClient(ctx);
    if (metadata.IsErr()) {
        return VoidResult::Err(metadata.Error());
    }
    auto document = metadata.Value().GetOpenApi(client.Value(), service.Value());
    if (document.IsErr()) {
        return VoidResult::Err(document.Error());
    }

    if (!ctx.config.flags.endpoints) {
        ctx.output.PrintDocument(document.Value().content);
        return VoidResult::Ok();
    }

    auto endpoints = ListOpenApiEndpoints(std::string_view(document.Value().content));
    if (endpoints.IsErr()) {
        return VoidResult::Err(endpoints.Error());
    }
    std::vector<std::string> lines;
    auto json = nlohmann::json::array();
    for (const auto& endpoint : endpoints.Value()) {
        lines.push_back(endpoint.method + " " + endpoint.path);
        json.push_back({{"method", endpoint.method},
                        {"path", endpoint.path},
                        {"operationId", endpoint.operation_id},
                        {"summary", endpoint.summary},
                        {"description", endpoint.description}});
    }
    ctx.output.PrintRecords(lines, json);
    return VoidResult::Ok();
}

} // anonymous namespace

void RegisterAllCommands(CommandRouter& router) {
    router.Register("members", "List members of the instance",
                    "xrdinfo members --anchor <file>", RunMembers);
    router.Register("subsystems", "List subsystems of the instance",
                    "xrdinfo subsystems --anchor <file> [--with-name | --with-server] "
                    "[--registered]",
                    RunSubsystems);
    router.Register("servers", "List security servers and their addresses",
                    "xrdinfo servers --anchor <file>", RunServers);
    router.Register("server-ips", "List IP addresses of security servers",
                    "xrdinfo server-ips --anchor <file>", RunServerIps);
    router.Register("groups", "List global groups",
                    "xrdinfo groups --anchor <file>", RunGroups);
    router.Register("central-services", "List central services",
                    "xrdinfo central-services --anchor <file>", RunCentralServices);
    router.Register("conf-status", "Show source, parts and expiry of the configuration",
                    "xrdinfo conf-status --anchor <file>", RunConfStatus);
    router.Register("methods", "List services of a producer",
                    "xrdinfo methods <producer> --client <id> [--allowed] [--rest]",
                    RunMethods);
    router.Register("wsdl", "Print the WSDL of a service",
                    "xrdinfo wsdl <service> --client <id> [--rest]", RunWsdl);
    router.Register("wsdl-operations", "List operations in the WSDL of a service",
                    "xrdinfo wsdl-operations <service> --client <id> [--rest]",
                    RunWsdlOperations);
    router.Register("openapi", "Print the OpenAPI description of a REST service",
                    "xrdinfo openapi <service> --client <id> [--endpoints]", RunOpenApi);
}

} // namespace xrdinfo
