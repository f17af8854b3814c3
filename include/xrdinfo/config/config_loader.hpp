#pragma once

#include <xrdinfo/config/app_config.hpp>
#include <xrdinfo/core/result.hpp>

#include <string_view>

namespace xrdinfo {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. argv[1] is the command; the
// remaining positional tokens become AppConfig::arguments.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Check value ranges and flag combinations.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace xrdinfo
