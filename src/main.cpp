#include <remodern/cli/command_executor.hpp>
#include <remodern/cli/output_formatter.hpp>
#include <remodern/config/config_loader.hpp>
#include <remodern/core/log.hpp>
#include <remodern/core/terminal.hpp>
#include <remodern/core/version.hpp>
#include <remodern/mcp/mcp_server.hpp>
#include <remodern/mcp/tool_registry.hpp>
#include <remodern/tools/builtin_tools.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitInternal = 99;

bool UseColor(remodern::LogFormat format, bool is_tty) {
    switch (format) {
        case remodern::LogFormat::Color: return true;
        case remodern::LogFormat::Plain:
        case remodern::LogFormat::Json:  return false;
        case remodern::LogFormat::Auto:  break;
    }
    return is_tty && !remodern::NoColorEnvSet();
}

// Build the sink described by the logging section. Logs never go to stdout:
// in mcp mode stdout carries the protocol.
remodern::Result<std::unique_ptr<remodern::ILogSink>, std::string> MakeLogSink(
    const remodern::LoggingConfig& log) {
    using namespace remodern;
    using SinkResult = Result<std::unique_ptr<ILogSink>, std::string>;

    bool json = log.format == LogFormat::Json;
    if (log.file) {
        auto file = FileSink::Open(*log.file, json);
        if (file.IsErr()) {
            return SinkResult::Err(file.Error());
        }
        return SinkResult::Ok(std::unique_ptr<ILogSink>(std::move(file).Value()));
    }
    if (json) {
        return SinkResult::Ok(std::make_unique<JsonSink>(std::cerr));
    }
    return SinkResult::Ok(
        std::make_unique<ConsoleSink>(UseColor(log.format, IsStderrTty())));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace remodern;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        OutputFormatter(false).PrintError(cli_result.Error());
        return kExitInternal;
    }
    const auto& cli = cli_result.Value();

    AppConfig base;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            OutputFormatter(cli.json_output).PrintError(yaml.Error());
            return kExitInternal;
        }
        base = std::move(yaml).Value();
    }

    auto config = MergeConfigs(base, cli);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        OutputFormatter(config.json_output).PrintError(valid.Error());
        return kExitInternal;
    }

    auto sink = MakeLogSink(config.log);
    if (sink.IsErr()) {
        OutputFormatter(config.json_output).PrintError(sink.Error());
        return kExitInternal;
    }
    InitGlobalLogger(std::move(sink).Value(), config.log.level);
    LogDebug("main", std::string(kProgramName) + " " + kVersion + " starting");

    ToolRegistry registry;
    auto registered = RegisterBuiltinTools(registry, config.disabled_tools);
    if (registered.IsErr()) {
        LogError("main", registered.Error().ToString());
        OutputFormatter(config.json_output).PrintError(registered.Error());
        return registered.Error().ExitCode();
    }

    OutputFormatter fmt(config.json_output,
                        !NoColorEnvSet() && IsStdoutTty());

    switch (cli.command) {
        case Command::Mcp: {
            ServerInfo info;
            info.name = config.server.name;
            info.protocol_version = config.server.protocol_version;
            McpServer server(registry, info);
            server.Run();
            return kExitSuccess;
        }
        case Command::ListTools:
            return RunListTools(registry, fmt);
        case Command::Describe:
            return RunDescribe(registry, fmt, cli.tool_name);
        case Command::Call:
            return RunCall(registry, fmt, cli.tool_name, cli.arguments_json);
    }
    return kExitInternal;
}
