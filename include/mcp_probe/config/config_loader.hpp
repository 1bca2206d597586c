#pragma once

#include <mcp_probe/config/app_config.hpp>
#include <mcp_probe/core/result.hpp>

#include <string_view>

namespace mcp_probe {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse `run` flags (argv without the subcommand token) into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values in cli_overrides that differ from the defaults
// replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_probe
