#pragma once

#include <optional>
#include <string>
#include <vector>

namespace xrdinfo {

struct TlsConfig {
    std::optional<std::string> cert;  // client certificate (PEM)
    std::optional<std::string> key;   // client private key (PEM)
    std::optional<std::string> ca;    // CA bundle for server verification
};

// Per-command switches; each applies to one command only.
struct CommandFlags {
    bool with_name = false;    // subsystems
    bool with_server = false;  // subsystems
    bool registered = false;   // subsystems
    bool allowed = false;      // methods
    bool endpoints = false;    // openapi
};

constexpr double kDefaultTimeoutSeconds = 5.0;
constexpr const char* kDefaultUserId = "xrdinfo";

// Settings that have a default stay unset until a source names them, so a
// command-line value equal to the default still overrides the file.
struct AppConfig {
    std::string command;
    std::vector<std::string> arguments;  // positional arguments of the command
    std::optional<std::string> config_file;

    std::optional<std::string> anchor;           // anchor XML file
    std::optional<std::string> security_server;  // gateway for metaservice calls
    std::optional<std::string> instance;         // expected instance identifier
    std::optional<std::string> client;           // client identifier (wire form)
    TlsConfig tls;
    std::optional<double> timeout_seconds;  // may be fractional
    std::optional<std::string> user_id;
    bool rest = false;

    CommandFlags flags;

    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;

    [[nodiscard]] double TimeoutSeconds() const {
        return timeout_seconds.value_or(kDefaultTimeoutSeconds);
    }
    [[nodiscard]] std::string UserId() const { return user_id.value_or(kDefaultUserId); }
};

} // namespace xrdinfo
