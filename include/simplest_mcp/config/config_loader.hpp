#pragma once

#include <simplest_mcp/config/app_config.hpp>
#include <simplest_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace simplest_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields that differ from their defaults in
// cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are usable for start-up.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Map "http"/"stdio" (case-insensitive) to a transport.
Result<TransportKind, Error> ParseTransport(std::string_view text);

} // namespace simplest_mcp
