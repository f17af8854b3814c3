#include <xrdinfo/cli/command_router.hpp>

#include <algorithm>

namespace xrdinfo {

void CommandRouter::Register(const std::string& name,
                             const std::string& description,
                             const std::string& usage,
                             CommandHandler handler) {
    CommandInfo info;
    info.name = name;
    info.description = description;
    info.usage = usage;
    info.handler = std::move(handler);
    commands_[name] = std::move(info);
}

int CommandRouter::Dispatch(const CommandContext& ctx) const {
    auto it = commands_.find(ctx.config.command);
    if (it == commands_.end()) {
        Error error{"xrdinfo", "", std::nullopt,
                    "Unknown command '" + ctx.config.command + "'",
                    std::nullopt, ErrorCategory::InvalidArgument};
        ctx.output.PrintError(error);
        return error.ExitCode();
    }

    OrSilent(ctx.logger)->Debug("cli", "Running command " + it->first);
    auto result = it->second.handler(ctx);
    if (result.IsErr()) {
        ctx.output.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    return 0;
}

bool CommandRouter::HasCommand(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

std::vector<CommandInfo> CommandRouter::Commands() const {
    std::vector<CommandInfo> result;
    result.reserve(commands_.size());
    for (const auto& [name, info] : commands_) {
        result.push_back(info);
    }
    return result;
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "Usage: xrdinfo <command> [arguments] [options]\n\n";
    out << "Commands:\n";

    size_t max_len = 0;
    for (const auto& [name, info] : commands_) {
        max_len = std::max(max_len, name.size());
    }
    for (const auto& [name, info] : commands_) {
        out << "  " << name;
        out << std::string(max_len - name.size() + 4, ' ');
        out << info.description << "\n";
    }

    out << "\nUsage per command:\n";
    for (const auto& [name, info] : commands_) {
        out << "  " << info.usage << "\n";
    }

    out << "\nCommon options:\n"
        << "  -c, --config <file>            YAML config file\n"
        << "  -a, --anchor <file>            configuration anchor XML\n"
        << "  -s, --security-server <addr>   security server for metaservices, and\n"
        << "                                 configuration source without an anchor\n"
        << "  -i, --instance <id>            expected instance identifier\n"
        << "  --client <id>                  client identifier\n"
        << "  --cert <file> --key <file>     TLS client certificate and key\n"
        << "  --ca <file>                    CA bundle for server verification\n"
        << "  --timeout <seconds>            per-request timeout (e.g. 0.5)\n"
        << "  --rest                         use REST metaservices\n"
        << "  --json                         JSON output\n"
        << "  -v, --verbose | -q, --quiet    log verbosity\n";
}

} // namespace xrdinfo
