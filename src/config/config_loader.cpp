#include <remodern/config/config_loader.hpp>

#include <remodern/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace remodern {

namespace {

std::string Lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Result<void, std::string> ApplyYamlLogging(const YAML::Node& node, LoggingConfig& log) {
    if (node["level"]) {
        auto text = node["level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level) {
            return Result<void, std::string>::Err("Invalid log.level: '" + text + "'");
        }
        log.level = *level;
    }
    if (node["format"]) {
        auto text = node["format"].as<std::string>();
        auto format = ParseLogFormat(text);
        if (!format) {
            return Result<void, std::string>::Err("Invalid log.format: '" + text + "'");
        }
        log.format = *format;
    }
    if (node["file"]) {
        log.file = node["file"].as<std::string>();
    }
    return Result<void, std::string>::Ok();
}

} // anonymous namespace

std::optional<LogFormat> ParseLogFormat(std::string_view name) {
    auto lower = Lowercase(name);
    if (lower == "auto")  return LogFormat::Auto;
    if (lower == "plain") return LogFormat::Plain;
    if (lower == "color") return LogFormat::Color;
    if (lower == "json")  return LogFormat::Json;
    return std::nullopt;
}

const char* LogFormatName(LogFormat format) {
    switch (format) {
        case LogFormat::Auto:  return "auto";
        case LogFormat::Plain: return "plain";
        case LogFormat::Color: return "color";
        case LogFormat::Json:  return "json";
    }
    return "auto";
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, std::string> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        auto root = YAML::LoadFile(std::string(file_path));

        if (const auto server = root["server"]) {
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["protocol_version"]) {
                config.server.protocol_version =
                    server["protocol_version"].as<std::string>();
            }
        }

        if (const auto log = root["log"]) {
            auto applied = ApplyYamlLogging(log, config.log);
            if (applied.IsErr()) {
                return Result<AppConfig, std::string>::Err(std::move(applied).Error());
            }
        }

        if (const auto tools = root["tools"]) {
            if (const auto disabled = tools["disabled"]) {
                if (!disabled.IsSequence()) {
                    return Result<AppConfig, std::string>::Err(
                        "tools.disabled must be a list of tool names");
                }
                for (const auto& name : disabled) {
                    config.disabled_tools.push_back(name.as<std::string>());
                }
            }
        }

        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, std::string>::Err(
            "Failed to parse YAML file '" + std::string(file_path) + "': " + e.what());
    }

    return Result<AppConfig, std::string>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, std::string> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kProgramName, kVersion);
    program.add_description("Registry of pluggable tools served over MCP (JSON-RPC on stdio).");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    program.add_argument("--verbose")
        .help("Shorthand for --log-level info")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Shorthand for --log-level debug")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-format")
        .help("Log format: auto, plain, color, json");
    program.add_argument("--log-file")
        .help("Append log lines to this file instead of stderr");
    program.add_argument("--json")
        .help("JSON output for CLI commands")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--disable-tool")
        .help("Do not register this built-in tool (repeatable)")
        .default_value(std::vector<std::string>{})
        .append();

    argparse::ArgumentParser mcp_cmd("mcp");
    mcp_cmd.add_description("Serve MCP requests on stdin/stdout");
    program.add_subparser(mcp_cmd);

    argparse::ArgumentParser list_cmd("list-tools");
    list_cmd.add_description("List all available tools");
    program.add_subparser(list_cmd);

    argparse::ArgumentParser describe_cmd("describe");
    describe_cmd.add_description("Print a tool's input schema");
    describe_cmd.add_argument("tool").help("Tool name");
    program.add_subparser(describe_cmd);

    argparse::ArgumentParser call_cmd("call");
    call_cmd.add_description("Execute a tool directly");
    call_cmd.add_argument("tool").help("Tool name");
    call_cmd.add_argument("-a", "--args")
        .help("Tool arguments as a JSON object")
        .default_value(std::string("{}"));
    program.add_subparser(call_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, std::string>::Err(
            "CLI parse error: " + std::string(e.what()));
    }

    CliOptions options;

    if (program.is_subcommand_used(mcp_cmd)) {
        options.command = Command::Mcp;
    } else if (program.is_subcommand_used(list_cmd)) {
        options.command = Command::ListTools;
    } else if (program.is_subcommand_used(describe_cmd)) {
        options.command = Command::Describe;
        options.tool_name = describe_cmd.get<std::string>("tool");
    } else if (program.is_subcommand_used(call_cmd)) {
        options.command = Command::Call;
        options.tool_name = call_cmd.get<std::string>("tool");
        options.arguments_json = call_cmd.get<std::string>("--args");
    } else {
        return Result<CliOptions, std::string>::Err(
            "Missing command (mcp, list-tools, describe, call). Run '" +
            std::string(kProgramName) + " --help' for usage.");
    }

    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }

    if (program.get<bool>("--verbose")) {
        options.log_level = LogLevel::Info;
    }
    if (program.get<bool>("--debug")) {
        options.log_level = LogLevel::Debug;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, std::string>::Err(
                "Invalid --log-level: '" + *val + "'");
        }
        options.log_level = *level;
    }

    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (!format) {
            return Result<CliOptions, std::string>::Err(
                "Invalid --log-format: '" + *val + "'");
        }
        options.log_format = *format;
    }
    if (auto val = program.present("--log-file")) {
        options.log_file = *val;
    }

    options.json_output = program.get<bool>("--json");
    options.disabled_tools = program.get<std::vector<std::string>>("--disable-tool");

    return Result<CliOptions, std::string>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.log_level) {
        merged.log.level = *cli.log_level;
    }
    if (cli.log_format) {
        merged.log.format = *cli.log_format;
    }
    if (cli.log_file) {
        merged.log.file = cli.log_file;
    }
    if (cli.json_output) {
        merged.json_output = true;
    }
    for (const auto& name : cli.disabled_tools) {
        if (std::find(merged.disabled_tools.begin(), merged.disabled_tools.end(), name) ==
            merged.disabled_tools.end()) {
            merged.disabled_tools.push_back(name);
        }
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, std::string> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, std::string>::Err("server.name must not be empty");
    }
    if (config.server.protocol_version.empty()) {
        return Result<void, std::string>::Err("server.protocol_version must not be empty");
    }
    if (config.log.file && config.log.file->empty()) {
        return Result<void, std::string>::Err("log.file must not be empty when set");
    }
    std::set<std::string> seen;
    for (const auto& name : config.disabled_tools) {
        if (name.empty()) {
            return Result<void, std::string>::Err("Disabled tool names must not be empty");
        }
        if (!seen.insert(name).second) {
            return Result<void, std::string>::Err("Tool disabled twice: " + name);
        }
    }
    return Result<void, std::string>::Ok();
}

} // namespace remodern
