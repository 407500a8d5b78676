#pragma once

#include <remodern/core/log.hpp>
#include <remodern/core/version.hpp>

#include <optional>
#include <string>
#include <vector>

namespace remodern {

enum class LogFormat {
    Auto,   // colored when stderr is a terminal and NO_COLOR is unset
    Plain,
    Color,
    Json,
};

struct ServerConfig {
    std::string name = kProgramName;
    std::string protocol_version = "2024-11-05";
};

struct LoggingConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Auto;
    std::optional<std::string> file; // log to this file instead of stderr
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig log;
    std::vector<std::string> disabled_tools;
    bool json_output = false;
};

// Front-end command selected on the command line.
enum class Command {
    Mcp,
    ListTools,
    Describe,
    Call,
};

// Everything parsed from argv. Unset optionals leave the YAML value alone.
struct CliOptions {
    Command command = Command::Mcp;
    std::optional<std::string> config_path;
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    std::optional<std::string> log_file;
    bool json_output = false;
    std::vector<std::string> disabled_tools;

    std::string tool_name;              // describe, call
    std::string arguments_json = "{}";  // call
};

} // namespace remodern
