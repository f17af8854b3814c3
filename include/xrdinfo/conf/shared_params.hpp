#pragma once

#include <xrdinfo/conf/trust_verifier.hpp>
#include <xrdinfo/core/identifier.hpp>
#include <xrdinfo/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// Shared-parameters records.
// ---------------------------------------------------------------------------

struct Member {
    XRoadId id;
    std::string member_class;
    std::string member_code;
    std::optional<std::string> name;
};

struct Subsystem {
    XRoadId id;
    XRoadId member_id;
    std::string subsystem_code;
};

struct SecurityServer {
    XRoadId id;
    XRoadId owner_id;
    std::string server_code;
    std::optional<std::string> address;
    // Members and subsystems registered as clients, in document order.
    std::vector<XRoadId> clients;
};

struct GlobalGroup {
    std::string group_code;
    std::optional<std::string> description;
    std::vector<XRoadId> members;
};

struct CentralService {
    std::string service_code;
    std::optional<XRoadId> implementing_service;
};

struct SubsystemWithMemberName {
    Subsystem subsystem;
    std::optional<std::string> member_name;
};

// One row per server the subsystem is registered on; a subsystem on no
// server appears once with server unset.
struct SubsystemWithServer {
    Subsystem subsystem;
    std::optional<SecurityServer> server;
};

// ---------------------------------------------------------------------------
// SharedParams — read-only indices over one verified shared-parameters part.
//
// Built from a VerifiedPart, so nothing here is visible unless the part
// passed digest and signature verification, or from a document a security
// server already verified (ParseDocument). The document dialect follows
// the part's Version header: version 2 carries central services, version 3
// and later do not. Member names and server addresses are optional in
// every version.
// ---------------------------------------------------------------------------
class SharedParams {
public:
    [[nodiscard]] static Result<SharedParams, Error> Parse(const VerifiedPart& part);

    /// Parses a shared-parameters document without a signed directory
    /// around it. Without a version the version 2 dialect is used, which
    /// also accepts version 3 documents. expected_instance, when set, must
    /// match the document's instanceIdentifier.
    [[nodiscard]] static Result<SharedParams, Error> ParseDocument(
        std::string_view xml, const std::string& location,
        const std::optional<std::string>& version,
        const std::optional<std::string>& expected_instance);

    [[nodiscard]] const std::string& Instance() const noexcept { return instance_; }
    [[nodiscard]] int SchemaVersion() const noexcept { return schema_version_; }

    [[nodiscard]] const std::vector<Member>& Members() const noexcept { return members_; }
    [[nodiscard]] const std::vector<Subsystem>& Subsystems() const noexcept {
        return subsystems_;
    }
    [[nodiscard]] const std::vector<SecurityServer>& SecurityServers() const noexcept {
        return servers_;
    }
    [[nodiscard]] const std::vector<GlobalGroup>& GlobalGroups() const noexcept {
        return groups_;
    }
    [[nodiscard]] const std::vector<CentralService>& CentralServices() const noexcept {
        return central_services_;
    }

    [[nodiscard]] std::vector<SubsystemWithMemberName> SubsystemsWithMemberName() const;
    [[nodiscard]] std::vector<SubsystemWithServer> SubsystemsWithServer() const;

    /// Subsystems registered as a client on at least one server.
    [[nodiscard]] std::vector<Subsystem> RegisteredSubsystems() const;

    [[nodiscard]] std::optional<Member> FindMember(const XRoadId& member_id) const;

    /// Servers on which id (a member or subsystem) is a client; for a member,
    /// servers it owns come first.
    [[nodiscard]] std::vector<SecurityServer> ServersFor(const XRoadId& id) const;

    /// Address of the first server with an address that serves id. Fails
    /// with AddressResolution when none is registered.
    [[nodiscard]] Result<std::string, Error> ResolveAddress(const XRoadId& id) const;

private:
    SharedParams() = default;

    std::string instance_;
    int schema_version_ = 2;
    std::vector<Member> members_;
    std::vector<Subsystem> subsystems_;
    std::vector<SecurityServer> servers_;
    std::vector<GlobalGroup> groups_;
    std::vector<CentralService> central_services_;
};

// ---------------------------------------------------------------------------
// Host address lookup for security servers.
// ---------------------------------------------------------------------------

using HostResolver = std::function<std::vector<std::string>(const std::string& host)>;

/// IPv4 addresses of host via the system resolver; empty when the name does
/// not resolve.
std::vector<std::string> ResolveHostIps(const std::string& host);

/// IP addresses of every server address, in server order. Servers without
/// an address and names that do not resolve are skipped.
std::vector<std::string> ListServerIps(const SharedParams& params,
                                       const HostResolver& resolver = ResolveHostIps);

} // namespace xrdinfo
