#pragma once

#include <xrdinfo/cli/command_router.hpp>

namespace xrdinfo {

// Register every xrdinfo command: members, subsystems, servers, server-ips,
// groups, central-services, conf-status, methods, wsdl, wsdl-operations,
// openapi.
void RegisterAllCommands(CommandRouter& router);

} // namespace xrdinfo
