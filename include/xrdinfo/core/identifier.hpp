#pragma once

#include <xrdinfo/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// ObjectType — the id:objectType attribute of an identifier.
// ---------------------------------------------------------------------------
enum class ObjectType {
    Member,
    Subsystem,
    Service,
    Server,
};

[[nodiscard]] const char* ObjectTypeName(ObjectType type);

// ---------------------------------------------------------------------------
// XRoadId — identifier of a member, subsystem, service or security server.
//
// Segments are held decoded. The wire form joins the percent-encoded
// segments with '/':
//   MEMBER     INSTANCE/CLASS/CODE
//   SUBSYSTEM  INSTANCE/CLASS/CODE/SUBSYSTEM
//   SERVICE    INSTANCE/CLASS/CODE/SUBSYSTEM/SERVICE[/VERSION]
//   SERVER     INSTANCE/CLASS/CODE/SERVERCODE
// A service's subsystem segment may be empty (member-level service), and a
// service written with six segments keeps its version even when empty.
// ---------------------------------------------------------------------------
class XRoadId {
public:
    static Result<XRoadId, std::string> Member(std::string_view instance,
                                               std::string_view member_class,
                                               std::string_view member_code);

    static Result<XRoadId, std::string> Subsystem(std::string_view instance,
                                                  std::string_view member_class,
                                                  std::string_view member_code,
                                                  std::string_view subsystem_code);

    static Result<XRoadId, std::string> Service(
        std::string_view instance,
        std::string_view member_class,
        std::string_view member_code,
        std::string_view subsystem_code,
        std::string_view service_code,
        std::optional<std::string> service_version = std::nullopt);

    static Result<XRoadId, std::string> Server(std::string_view instance,
                                               std::string_view member_class,
                                               std::string_view member_code,
                                               std::string_view server_code);

    /// Build from decoded segments; the type follows the segment count
    /// (3 member, 4 subsystem, 5 service, 6 versioned service).
    static Result<XRoadId, std::string> FromParts(const std::vector<std::string>& parts);

    /// Parse the wire form; the type follows the segment count.
    static Result<XRoadId, std::string> Parse(std::string_view wire);

    /// Parse the wire form of a security server identifier.
    static Result<XRoadId, std::string> ParseServer(std::string_view wire);

    [[nodiscard]] ObjectType Type() const noexcept { return type_; }
    [[nodiscard]] const std::string& Instance() const noexcept { return instance_; }
    [[nodiscard]] const std::string& MemberClass() const noexcept { return member_class_; }
    [[nodiscard]] const std::string& MemberCode() const noexcept { return member_code_; }
    [[nodiscard]] const std::string& SubsystemCode() const noexcept { return subsystem_code_; }
    [[nodiscard]] const std::string& ServiceCode() const noexcept { return service_code_; }
    [[nodiscard]] const std::optional<std::string>& ServiceVersion() const noexcept {
        return service_version_;
    }
    [[nodiscard]] const std::string& ServerCode() const noexcept { return server_code_; }

    /// Decoded segments in wire order.
    [[nodiscard]] std::vector<std::string> Parts() const;

    /// Wire form: percent-encoded segments joined with '/'. Always the
    /// canonical encoding, not the text Parse was given ("a%2fb" comes back
    /// as "a%2Fb", "%41" as "A").
    [[nodiscard]] std::string ToString() const;

    /// The owning member of any identifier.
    [[nodiscard]] XRoadId MemberId() const;

    /// The member or subsystem providing a service; for members and
    /// subsystems the identifier itself.
    [[nodiscard]] XRoadId ProviderId() const;

    bool operator==(const XRoadId& other) const;
    bool operator!=(const XRoadId& other) const { return !(*this == other); }
    bool operator<(const XRoadId& other) const;

private:
    XRoadId() = default;

    ObjectType type_ = ObjectType::Member;
    std::string instance_;
    std::string member_class_;
    std::string member_code_;
    std::string subsystem_code_;
    std::string service_code_;
    std::optional<std::string> service_version_;
    std::string server_code_;
};

/// Split a wire identifier into decoded segments.
std::vector<std::string> IdentifierParts(std::string_view wire);

/// Join decoded segments into the wire form.
std::string JoinIdentifier(const std::vector<std::string>& parts);

} // namespace xrdinfo
