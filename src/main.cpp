#include <xrdinfo/cli/command_router.hpp>
#include <xrdinfo/cli/commands.hpp>
#include <xrdinfo/cli/output_formatter.hpp>
#include <xrdinfo/config/config_loader.hpp>
#include <xrdinfo/core/log.hpp>
#include <xrdinfo/core/terminal.hpp>
#include <xrdinfo/core/version.hpp>
#include <xrdinfo/http/http_transport.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

bool WantsHelp(int argc, const char* const* argv) {
    if (argc == 1) {
        return true;
    }
    std::string_view first{argv[1]};
    return first == "--help" || first == "-h" || first == "help";
}

bool WantsVersion(int argc, const char* const* argv) {
    return argc >= 2 && std::string_view{argv[1]} == "--version";
}

xrdinfo::LogLevel LogLevelFor(const xrdinfo::AppConfig& config) {
    if (config.verbose) {
        return xrdinfo::LogLevel::Debug;
    }
    if (config.quiet) {
        return xrdinfo::LogLevel::Error;
    }
    return xrdinfo::LogLevel::Warn;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace xrdinfo;

    CommandRouter router;
    RegisterAllCommands(router);

    if (WantsHelp(argc, argv)) {
        router.PrintHelp(std::cout);
        return 0;
    }
    if (WantsVersion(argc, argv)) {
        std::cout << "xrdinfo " << kVersion << "\n";
        return 0;
    }

    const bool use_color = !NoColorEnvSet() && IsStderrTty();

    // Step 1: command line.
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        OutputFormatter(false, use_color).PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto config = std::move(cli_result).Value();

    // Step 2: YAML config file, overridden by the command line.
    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            OutputFormatter(config.json_output, use_color).PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    OutputFormatter output(config.json_output, use_color);

    // Step 3: validate.
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        output.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 4: logging. A log file gets JSON lines; otherwise stderr.
    std::ofstream log_stream;
    std::unique_ptr<ILogSink> sink;
    if (config.log_file.has_value()) {
        log_stream.open(*config.log_file, std::ios::app);
        if (!log_stream) {
            Error error{"xrdinfo", "", std::nullopt, "Can not open log file " + *config.log_file,
                        std::nullopt, ErrorCategory::InvalidArgument};
            output.PrintError(error);
            return error.ExitCode();
        }
        sink = std::make_unique<JsonSink>(log_stream);
    } else if (config.json_output) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }
    auto logger = std::make_shared<Logger>(std::move(sink), LogLevelFor(config));

    // Step 5: transport. Server certificates are checked when a CA bundle
    // is configured.
    HttpTransportOptions transport_options;
    transport_options.tls.cert_file = config.tls.cert;
    transport_options.tls.key_file = config.tls.key;
    transport_options.tls.ca_file = config.tls.ca;
    transport_options.tls.verify_server = config.tls.ca.has_value();
    transport_options.logger = logger;
    HttpTransport transport(std::move(transport_options));

    // Step 6: run.
    CommandContext ctx{config, transport, output, logger, {}, {}};
    return router.Dispatch(ctx);
}
