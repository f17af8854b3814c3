#pragma once

#include <xrdinfo/cli/output_formatter.hpp>
#include <xrdinfo/conf/shared_params.hpp>
#include <xrdinfo/config/app_config.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/result.hpp>
#include <xrdinfo/core/timestamp.hpp>
#include <xrdinfo/http/i_http_transport.hpp>

#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// CommandContext — everything a command needs, built once by main().
// ---------------------------------------------------------------------------
struct CommandContext {
    const AppConfig& config;
    IHttpTransport& transport;
    const OutputFormatter& output;
    std::shared_ptr<Logger> logger;
    // Current time for configuration expiry; the system clock when unset.
    std::function<TimePoint()> clock;
    // Host lookup for server-ips; the system resolver when unset.
    HostResolver resolver;
};

// ---------------------------------------------------------------------------
// CommandHandler — function type for command implementations. Errors are
// printed by the router and mapped to the exit code of their category.
// ---------------------------------------------------------------------------
using CommandHandler = std::function<Result<void, Error>(const CommandContext& ctx)>;

struct CommandInfo {
    std::string name;
    std::string description;
    std::string usage;  // e.g. "xrdinfo wsdl <service> --client <id>"
    CommandHandler handler;
};

// ---------------------------------------------------------------------------
// CommandRouter — single-level dispatch on AppConfig::command.
//
// Usage:
//   CommandRouter router;
//   RegisterAllCommands(router);
//   return router.Dispatch(ctx);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& name,
                  const std::string& description,
                  const std::string& usage,
                  CommandHandler handler);

    // Run the command named by ctx.config.command. Returns 0 on success,
    // the error's exit code otherwise.
    int Dispatch(const CommandContext& ctx) const;

    [[nodiscard]] bool HasCommand(const std::string& name) const;

    // All registered commands, sorted by name.
    [[nodiscard]] std::vector<CommandInfo> Commands() const;

    void PrintHelp(std::ostream& out) const;

private:
    std::map<std::string, CommandInfo> commands_;
};

} // namespace xrdinfo
