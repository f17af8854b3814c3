#include <xrdinfo/core/identifier.hpp>
#include <xrdinfo/core/url.hpp>

#include <tuple>

namespace xrdinfo {

namespace {

Result<XRoadId, std::string> Fail(std::string message) {
    return Result<XRoadId, std::string>::Err(std::move(message));
}

std::optional<std::string> CheckMemberSegments(std::string_view instance,
                                               std::string_view member_class,
                                               std::string_view member_code) {
    if (instance.empty()) return "xRoadInstance must not be empty";
    if (member_class.empty()) return "memberClass must not be empty";
    if (member_code.empty()) return "memberCode must not be empty";
    return std::nullopt;
}

} // anonymous namespace

const char* ObjectTypeName(ObjectType type) {
    switch (type) {
        case ObjectType::Member:    return "MEMBER";
        case ObjectType::Subsystem: return "SUBSYSTEM";
        case ObjectType::Service:   return "SERVICE";
        case ObjectType::Server:    return "SERVER";
    }
    return "MEMBER";
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------
Result<XRoadId, std::string> XRoadId::Member(std::string_view instance,
                                             std::string_view member_class,
                                             std::string_view member_code) {
    if (auto err = CheckMemberSegments(instance, member_class, member_code)) {
        return Fail(*err);
    }
    XRoadId id;
    id.type_ = ObjectType::Member;
    id.instance_ = std::string(instance);
    id.member_class_ = std::string(member_class);
    id.member_code_ = std::string(member_code);
    return Result<XRoadId, std::string>::Ok(std::move(id));
}

Result<XRoadId, std::string> XRoadId::Subsystem(std::string_view instance,
                                                std::string_view member_class,
                                                std::string_view member_code,
                                                std::string_view subsystem_code) {
    if (auto err = CheckMemberSegments(instance, member_class, member_code)) {
        return Fail(*err);
    }
    if (subsystem_code.empty()) {
        return Fail("subsystemCode must not be empty");
    }
    XRoadId id;
    id.type_ = ObjectType::Subsystem;
    id.instance_ = std::string(instance);
    id.member_class_ = std::string(member_class);
    id.member_code_ = std::string(member_code);
    id.subsystem_code_ = std::string(subsystem_code);
    return Result<XRoadId, std::string>::Ok(std::move(id));
}

Result<XRoadId, std::string> XRoadId::Service(std::string_view instance,
                                              std::string_view member_class,
                                              std::string_view member_code,
                                              std::string_view subsystem_code,
                                              std::string_view service_code,
                                              std::optional<std::string> service_version) {
    if (auto err = CheckMemberSegments(instance, member_class, member_code)) {
        return Fail(*err);
    }
    if (service_code.empty()) {
        return Fail("serviceCode must not be empty");
    }
    XRoadId id;
    id.type_ = ObjectType::Service;
    id.instance_ = std::string(instance);
    id.member_class_ = std::string(member_class);
    id.member_code_ = std::string(member_code);
    id.subsystem_code_ = std::string(subsystem_code);
    id.service_code_ = std::string(service_code);
    id.service_version_ = std::move(service_version);
    return Result<XRoadId, std::string>::Ok(std::move(id));
}

Result<XRoadId, std::string> XRoadId::Server(std::string_view instance,
                                             std::string_view member_class,
                                             std::string_view member_code,
                                             std::string_view server_code) {
    if (auto err = CheckMemberSegments(instance, member_class, member_code)) {
        return Fail(*err);
    }
    if (server_code.empty()) {
        return Fail("serverCode must not be empty");
    }
    XRoadId id;
    id.type_ = ObjectType::Server;
    id.instance_ = std::string(instance);
    id.member_class_ = std::string(member_class);
    id.member_code_ = std::string(member_code);
    id.server_code_ = std::string(server_code);
    return Result<XRoadId, std::string>::Ok(std::move(id));
}

Result<XRoadId, std::string> XRoadId::FromParts(const std::vector<std::string>& parts) {
    switch (parts.size()) {
        case 3:
            return Member(parts[0], parts[1], parts[2]);
        case 4:
            return Subsystem(parts[0], parts[1], parts[2], parts[3]);
        case 5:
            return Service(parts[0], parts[1], parts[2], parts[3], parts[4]);
        case 6:
            return Service(parts[0], parts[1], parts[2], parts[3], parts[4], parts[5]);
        default:
            return Fail("identifier must have 3 to 6 segments, got " +
                        std::to_string(parts.size()));
    }
}

Result<XRoadId, std::string> XRoadId::Parse(std::string_view wire) {
    if (wire.empty()) {
        return Fail("identifier must not be empty");
    }
    return FromParts(IdentifierParts(wire));
}

Result<XRoadId, std::string> XRoadId::ParseServer(std::string_view wire) {
    auto parts = IdentifierParts(wire);
    if (parts.size() != 4) {
        return Fail("server identifier must have 4 segments, got " +
                    std::to_string(parts.size()));
    }
    return Server(parts[0], parts[1], parts[2], parts[3]);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
std::vector<std::string> XRoadId::Parts() const {
    std::vector<std::string> parts{instance_, member_class_, member_code_};
    switch (type_) {
        case ObjectType::Member:
            break;
        case ObjectType::Subsystem:
            parts.push_back(subsystem_code_);
            break;
        case ObjectType::Service:
            parts.push_back(subsystem_code_);
            parts.push_back(service_code_);
            if (service_version_.has_value()) {
                parts.push_back(*service_version_);
            }
            break;
        case ObjectType::Server:
            parts.push_back(server_code_);
            break;
    }
    return parts;
}

std::string XRoadId::ToString() const {
    return JoinIdentifier(Parts());
}

XRoadId XRoadId::MemberId() const {
    XRoadId id;
    id.type_ = ObjectType::Member;
    id.instance_ = instance_;
    id.member_class_ = member_class_;
    id.member_code_ = member_code_;
    return id;
}

XRoadId XRoadId::ProviderId() const {
    if (type_ == ObjectType::Service && !subsystem_code_.empty()) {
        XRoadId id = MemberId();
        id.type_ = ObjectType::Subsystem;
        id.subsystem_code_ = subsystem_code_;
        return id;
    }
    if (type_ == ObjectType::Subsystem) {
        return *this;
    }
    return MemberId();
}

bool XRoadId::operator==(const XRoadId& other) const {
    return type_ == other.type_ && Parts() == other.Parts();
}

bool XRoadId::operator<(const XRoadId& other) const {
    return std::make_tuple(static_cast<int>(type_), Parts()) <
           std::make_tuple(static_cast<int>(other.type_), other.Parts());
}

// ---------------------------------------------------------------------------
// Wire helpers
// ---------------------------------------------------------------------------
std::vector<std::string> IdentifierParts(std::string_view wire) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto slash = wire.find('/', start);
        if (slash == std::string_view::npos) {
            parts.push_back(UrlDecode(wire.substr(start)));
            break;
        }
        parts.push_back(UrlDecode(wire.substr(start, slash - start)));
        start = slash + 1;
    }
    return parts;
}

std::string JoinIdentifier(const std::vector<std::string>& parts) {
    std::string wire;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            wire += '/';
        }
        wire += UrlEncode(parts[i]);
    }
    return wire;
}

} // namespace xrdinfo
