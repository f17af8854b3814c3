#include <xrdinfo/conf/shared_params.hpp>
#include <xrdinfo/conf/directory_parser.hpp>
#include "shared_params_schema.hpp"
#include "../xml/identifier_xml.hpp"
#include "../xml/xml_utils.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <map>
#include <set>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace xrdinfo {

namespace {

using xml_utils::ChildrenByLocalName;
using xml_utils::ChildText;
using xml_utils::ChildTextOr;
using xml_utils::FirstChildByLocalName;

Error FormatError(const std::string& location, const std::string& message) {
    return Error{"ParseSharedParams", location, std::nullopt, message, std::nullopt,
                 ErrorCategory::Format};
}

std::optional<std::string> NonEmpty(std::optional<std::string> value) {
    if (value.has_value() && value->empty()) {
        return std::nullopt;
    }
    return value;
}

std::string JoinedLabel(const XRoadId& id) {
    return std::string(ObjectTypeName(id.Type())) + ":" + id.ToString();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Parse
// ---------------------------------------------------------------------------
Result<SharedParams, Error> SharedParams::Parse(const VerifiedPart& verified) {
    const auto& part = verified.Part();
    const auto& location = part.location;

    if (part.content_identifier != kSharedParametersId) {
        return Result<SharedParams, Error>::Err(Error{
            "ParseSharedParams", location, std::nullopt,
            "Part " + part.content_identifier + " is not shared parameters", std::nullopt,
            ErrorCategory::InvalidArgument});
    }
    return ParseDocument(part.raw_bytes, location, part.version, part.instance);
}

Result<SharedParams, Error> SharedParams::ParseDocument(
    std::string_view xml, const std::string& location,
    const std::optional<std::string>& version,
    const std::optional<std::string>& expected_instance) {
    tinyxml2::XMLDocument doc;
    if (auto parse_error = xml_utils::ParseXmlOrError(
            doc, xml, "ParseSharedParams", location,
            "Failed to parse shared parameters XML")) {
        return Result<SharedParams, Error>::Err(std::move(*parse_error));
    }
    const auto* root = doc.RootElement();

    const auto schema = shared_params_schema::ForVersion(version);

    SharedParams params;
    params.schema_version_ = shared_params_schema::VersionOf(schema);
    params.instance_ = ChildTextOr(root, "instanceIdentifier");
    if (params.instance_.empty()) {
        return Result<SharedParams, Error>::Err(
            FormatError(location, "Shared parameters lack instanceIdentifier"));
    }
    if (expected_instance.has_value() && params.instance_ != *expected_instance) {
        return Result<SharedParams, Error>::Err(FormatError(
            location, "Shared parameters declare instance '" + params.instance_ +
                          "' but '" + *expected_instance + "' was expected"));
    }

    // IDREF targets: member and subsystem elements carry an id attribute.
    std::map<std::string, XRoadId> by_ref;
    std::set<XRoadId> seen_members;

    // -- Members and subsystems ----------------------------------------------
    for (const auto* element : ChildrenByLocalName(root, "member")) {
        const auto member_class =
            ChildTextOr(FirstChildByLocalName(element, "memberClass"), "code");
        const auto member_code = ChildTextOr(element, "memberCode");
        auto id = XRoadId::Member(params.instance_, member_class, member_code);
        if (id.IsErr()) {
            return Result<SharedParams, Error>::Err(
                FormatError(location, "Invalid member: " + id.Error()));
        }
        if (!seen_members.insert(id.Value()).second) {
            return Result<SharedParams, Error>::Err(
                FormatError(location, "Duplicate member " + id.Value().ToString()));
        }

        const auto ref = xml_utils::Attr(element, "id");
        if (!ref.empty() && !by_ref.emplace(ref, id.Value()).second) {
            return Result<SharedParams, Error>::Err(
                FormatError(location, "Duplicate element id '" + ref + "'"));
        }

        params.members_.push_back(Member{id.Value(), member_class, member_code,
                                         NonEmpty(ChildText(element, "name"))});

        std::set<std::string> subsystem_codes;
        for (const auto* sub : ChildrenByLocalName(element, "subsystem")) {
            const auto code = ChildTextOr(sub, "subsystemCode");
            auto sub_id = XRoadId::Subsystem(params.instance_, member_class, member_code, code);
            if (sub_id.IsErr()) {
                return Result<SharedParams, Error>::Err(FormatError(
                    location, "Invalid subsystem of " + id.Value().ToString() + ": " +
                                  sub_id.Error()));
            }
            if (!subsystem_codes.insert(code).second) {
                return Result<SharedParams, Error>::Err(FormatError(
                    location, "Duplicate subsystem " + sub_id.Value().ToString()));
            }
            const auto sub_ref = xml_utils::Attr(sub, "id");
            if (!sub_ref.empty() && !by_ref.emplace(sub_ref, sub_id.Value()).second) {
                return Result<SharedParams, Error>::Err(
                    FormatError(location, "Duplicate element id '" + sub_ref + "'"));
            }
            params.subsystems_.push_back(Subsystem{sub_id.Value(), id.Value(), code});
        }
    }

    auto lookup = [&](const std::string& ref) -> std::optional<XRoadId> {
        auto it = by_ref.find(ref);
        if (it == by_ref.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    // -- Security servers ----------------------------------------------------
    std::set<XRoadId> seen_servers;
    for (const auto* element : ChildrenByLocalName(root, "securityServer")) {
        const auto owner_ref = ChildTextOr(element, "owner");
        auto owner = lookup(owner_ref);
        if (!owner.has_value() || owner->Type() != ObjectType::Member) {
            return Result<SharedParams, Error>::Err(FormatError(
                location, "Security server owner '" + owner_ref + "' is not a member"));
        }
        const auto server_code = ChildTextOr(element, "serverCode");
        auto server_id = XRoadId::Server(params.instance_, owner->MemberClass(),
                                         owner->MemberCode(), server_code);
        if (server_id.IsErr()) {
            return Result<SharedParams, Error>::Err(
                FormatError(location, "Invalid security server: " + server_id.Error()));
        }
        if (!seen_servers.insert(server_id.Value()).second) {
            return Result<SharedParams, Error>::Err(FormatError(
                location, "Duplicate security server " + server_id.Value().ToString()));
        }

        SecurityServer server{server_id.Value(), *owner, server_code,
                              NonEmpty(ChildText(element, "address")), {}};
        for (const auto* client : ChildrenByLocalName(element, "client")) {
            const char* text = client->GetText();
            const std::string client_ref = text != nullptr ? text : "";
            auto client_id = lookup(client_ref);
            if (!client_id.has_value()) {
                return Result<SharedParams, Error>::Err(FormatError(
                    location, "Security server " + server_id.Value().ToString() +
                                  " lists unknown client '" + client_ref + "'"));
            }
            server.clients.push_back(*client_id);
        }
        params.servers_.push_back(std::move(server));
    }

    // -- Global groups -------------------------------------------------------
    for (const auto* element : ChildrenByLocalName(root, "globalGroup")) {
        GlobalGroup group;
        group.group_code = ChildTextOr(element, "groupCode");
        if (group.group_code.empty()) {
            return Result<SharedParams, Error>::Err(
                FormatError(location, "Global group without groupCode"));
        }
        group.description = NonEmpty(ChildText(element, "description"));
        for (const auto* member : ChildrenByLocalName(element, "groupMember")) {
            auto member_id = xml_utils::ReadIdentifier(member, ObjectType::Subsystem);
            if (member_id.IsErr()) {
                return Result<SharedParams, Error>::Err(FormatError(
                    location, "Global group " + group.group_code + ": " + member_id.Error()));
            }
            group.members.push_back(member_id.Value());
        }
        params.groups_.push_back(std::move(group));
    }

    // -- Central services (dialect dependent) --------------------------------
    auto central = std::visit(
        [root](const auto& dialect) { return dialect.CentralServices(root); }, schema);
    if (central.IsErr()) {
        return Result<SharedParams, Error>::Err(FormatError(location, central.Error()));
    }
    params.central_services_ = std::move(central).Value();

    return Result<SharedParams, Error>::Ok(std::move(params));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::vector<SubsystemWithMemberName> SharedParams::SubsystemsWithMemberName() const {
    std::vector<SubsystemWithMemberName> out;
    out.reserve(subsystems_.size());
    for (const auto& subsystem : subsystems_) {
        auto member = FindMember(subsystem.member_id);
        out.push_back({subsystem, member.has_value() ? member->name : std::nullopt});
    }
    return out;
}

std::vector<SubsystemWithServer> SharedParams::SubsystemsWithServer() const {
    std::vector<SubsystemWithServer> out;
    for (const auto& subsystem : subsystems_) {
        bool registered = false;
        for (const auto& server : servers_) {
            if (std::find(server.clients.begin(), server.clients.end(), subsystem.id) !=
                server.clients.end()) {
                out.push_back({subsystem, server});
                registered = true;
            }
        }
        if (!registered) {
            out.push_back({subsystem, std::nullopt});
        }
    }
    return out;
}

std::vector<Subsystem> SharedParams::RegisteredSubsystems() const {
    std::vector<Subsystem> out;
    for (const auto& subsystem : subsystems_) {
        const bool registered = std::any_of(
            servers_.begin(), servers_.end(), [&](const SecurityServer& server) {
                return std::find(server.clients.begin(), server.clients.end(),
                                 subsystem.id) != server.clients.end();
            });
        if (registered) {
            out.push_back(subsystem);
        }
    }
    return out;
}

std::optional<Member> SharedParams::FindMember(const XRoadId& member_id) const {
    const auto target = member_id.MemberId();
    for (const auto& member : members_) {
        if (member.id == target) {
            return member;
        }
    }
    return std::nullopt;
}

std::vector<SecurityServer> SharedParams::ServersFor(const XRoadId& id) const {
    const auto provider = id.Type() == ObjectType::Server ? id.MemberId() : id.ProviderId();
    std::vector<SecurityServer> out;
    auto add = [&out](const SecurityServer& server) {
        for (const auto& existing : out) {
            if (existing.id == server.id) {
                return;
            }
        }
        out.push_back(server);
    };
    if (provider.Type() == ObjectType::Member) {
        for (const auto& server : servers_) {
            if (server.owner_id == provider) {
                add(server);
            }
        }
    }
    for (const auto& server : servers_) {
        if (std::find(server.clients.begin(), server.clients.end(), provider) !=
            server.clients.end()) {
            add(server);
        }
    }
    return out;
}

Result<std::string, Error> SharedParams::ResolveAddress(const XRoadId& id) const {
    if (id.Instance() != instance_) {
        return Result<std::string, Error>::Err(Error{
            "ResolveAddress", id.ToString(), std::nullopt,
            "Identifier belongs to instance '" + id.Instance() + "', configuration is for '" +
                instance_ + "'",
            std::nullopt, ErrorCategory::AddressResolution});
    }
    for (const auto& server : ServersFor(id)) {
        if (server.address.has_value()) {
            return Result<std::string, Error>::Ok(*server.address);
        }
    }
    return Result<std::string, Error>::Err(Error{
        "ResolveAddress", id.ToString(), std::nullopt,
        "No security server address registered for " + JoinedLabel(id), std::nullopt,
        ErrorCategory::AddressResolution});
}

// ---------------------------------------------------------------------------
// Host lookup
// ---------------------------------------------------------------------------
std::vector<std::string> ResolveHostIps(const std::string& host) {
    std::vector<std::string> ips;
    if (host.empty()) {
        return ips;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0) {
        return ips;
    }
    for (const addrinfo* info = result; info != nullptr; info = info->ai_next) {
        const auto* addr = reinterpret_cast<const sockaddr_in*>(info->ai_addr);
        char buffer[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer)) == nullptr) {
            continue;
        }
        std::string ip(buffer);
        if (std::find(ips.begin(), ips.end(), ip) == ips.end()) {
            ips.push_back(std::move(ip));
        }
    }
    freeaddrinfo(result);
    return ips;
}

std::vector<std::string> ListServerIps(const SharedParams& params,
                                       const HostResolver& resolver) {
    std::vector<std::string> ips;
    for (const auto& server : params.SecurityServers()) {
        if (!server.address.has_value()) {
            continue;
        }
        for (auto& ip : resolver(*server.address)) {
            ips.push_back(std::move(ip));
        }
    }
    return ips;
}

} // namespace xrdinfo
