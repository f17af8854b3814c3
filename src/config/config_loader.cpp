#include <xrdinfo/config/config_loader.hpp>

#include <xrdinfo/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace xrdinfo {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

std::optional<std::string> OptionalString(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config file is not a mapping: " + std::string(file_path)));
        }

        config.anchor = OptionalString(root["anchor"]);
        config.security_server = OptionalString(root["security_server"]);
        config.instance = OptionalString(root["instance"]);
        config.client = OptionalString(root["client"]);

        // -- TLS --
        if (const auto tls = root["tls"]) {
            config.tls.cert = OptionalString(tls["cert"]);
            config.tls.key = OptionalString(tls["key"]);
            config.tls.ca = OptionalString(tls["ca"]);
        }

        // -- Options --
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<double>();
        }
        if (root["user_id"]) {
            config.user_id = root["user_id"].as<std::string>();
        }
        if (root["rest"]) {
            config.rest = root["rest"].as<bool>();
        }
        config.log_file = OptionalString(root["log_file"]);
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("xrdinfo", kVersion);

    program.add_argument("command")
        .help("Command to run (members, subsystems, servers, methods, ...)");
    program.add_argument("arguments")
        .help("Identifiers the command works on, in wire form")
        .nargs(argparse::nargs_pattern::any);

    // Configuration source and gateway
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-a", "--anchor")
        .help("Configuration anchor XML file");
    program.add_argument("-s", "--security-server")
        .help("Security server for metaservice requests; its verificationconf "
              "is the configuration source when no anchor is given");
    program.add_argument("-i", "--instance")
        .help("Expected X-Road instance identifier");
    program.add_argument("--client")
        .help("Client identifier: INSTANCE/CLASS/MEMBER[/SUBSYSTEM]");

    // TLS
    program.add_argument("--cert")
        .help("TLS client certificate (PEM)");
    program.add_argument("--key")
        .help("TLS client private key (PEM)");
    program.add_argument("--ca")
        .help("CA bundle for verifying the security server");

    // Request options
    program.add_argument("--timeout")
        .help("Timeout in seconds, fractions allowed")
        .scan<'g', double>();
    program.add_argument("--user-id")
        .help("userId header of SOAP requests");
    program.add_argument("--rest")
        .help("Use the REST protocol for metaservices")
        .default_value(false)
        .implicit_value(true);

    // Command switches
    program.add_argument("--with-name")
        .help("subsystems: include the member name")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--with-server")
        .help("subsystems: include the security servers")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--registered")
        .help("subsystems: only subsystems registered on a server")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--allowed")
        .help("methods: list only methods the client may call")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--endpoints")
        .help("openapi: list endpoints instead of the document")
        .default_value(false)
        .implicit_value(true);

    // Output
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.command = program.get<std::string>("command");
    if (auto val = program.present<std::vector<std::string>>("arguments")) {
        config.arguments = *val;
    }
    config.config_file = program.present("--config");

    config.anchor = program.present("--anchor");
    config.security_server = program.present("--security-server");
    config.instance = program.present("--instance");
    config.client = program.present("--client");

    config.tls.cert = program.present("--cert");
    config.tls.key = program.present("--key");
    config.tls.ca = program.present("--ca");

    config.timeout_seconds = program.present<double>("--timeout");
    config.user_id = program.present("--user-id");
    config.rest = program.get<bool>("--rest");

    config.flags.with_name = program.get<bool>("--with-name");
    config.flags.with_server = program.get<bool>("--with-server");
    config.flags.registered = program.get<bool>("--registered");
    config.flags.allowed = program.get<bool>("--allowed");
    config.flags.endpoints = program.get<bool>("--endpoints");

    config.json_output = program.get<bool>("--json");
    config.log_file = program.present("--log-file");
    config.verbose = program.get<bool>("--verbose");
    config.quiet = program.get<bool>("--quiet");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // The command line alone names the command and its switches.
    merged.command = cli_overrides.command;
    merged.arguments = cli_overrides.arguments;
    merged.flags = cli_overrides.flags;
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    if (cli_overrides.anchor.has_value()) {
        merged.anchor = cli_overrides.anchor;
    }
    if (cli_overrides.security_server.has_value()) {
        merged.security_server = cli_overrides.security_server;
    }
    if (cli_overrides.instance.has_value()) {
        merged.instance = cli_overrides.instance;
    }
    if (cli_overrides.client.has_value()) {
        merged.client = cli_overrides.client;
    }

    // TLS
    if (cli_overrides.tls.cert.has_value()) {
        merged.tls.cert = cli_overrides.tls.cert;
    }
    if (cli_overrides.tls.key.has_value()) {
        merged.tls.key = cli_overrides.tls.key;
    }
    if (cli_overrides.tls.ca.has_value()) {
        merged.tls.ca = cli_overrides.tls.ca;
    }

    // Options
    if (cli_overrides.timeout_seconds.has_value()) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.user_id.has_value()) {
        merged.user_id = cli_overrides.user_id;
    }
    if (cli_overrides.rest) {
        merged.rest = true;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    // A verbosity flag on the command line replaces the file's setting.
    if (cli_overrides.verbose || cli_overrides.quiet) {
        merged.verbose = cli_overrides.verbose;
        merged.quiet = cli_overrides.quiet;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.command.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing command"));
    }
    const double timeout = config.TimeoutSeconds();
    if (!std::isfinite(timeout) || timeout <= 0) {
        std::ostringstream shown;
        shown << timeout;
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " + shown.str()));
    }
    if (config.tls.cert.has_value() != config.tls.key.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("TLS client certificate and key must be given together"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    if (config.user_id.has_value() && config.user_id->empty()) {
        return Result<void, Error>::Err(MakeConfigError("user_id must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace xrdinfo
