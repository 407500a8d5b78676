#pragma once

#include <remodern/config/app_config.hpp>
#include <remodern/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace remodern {

// Parse a YAML config file into an AppConfig. Missing keys keep defaults.
Result<AppConfig, std::string> LoadFromYaml(std::string_view file_path);

// Parse argv: global flags plus one of the mcp / list-tools / describe /
// call subcommands.
Result<CliOptions, std::string> LoadFromCli(int argc, const char* const* argv);

// Apply command-line overrides on top of a base (YAML or default) config.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

Result<void, std::string> ValidateConfig(const AppConfig& config);

std::optional<LogFormat> ParseLogFormat(std::string_view name);
const char* LogFormatName(LogFormat format);

} // namespace remodern
