#include <remodern/cli/command_executor.hpp>

#include <remodern/core/log.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace remodern {

namespace {
constexpr const char* kComponent = "cli";
} // anonymous namespace

int RunListTools(const ToolRegistry& registry, const OutputFormatter& fmt) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& tool : registry.ListTools()) {
        rows.push_back({tool->Name(), tool->Description()});
    }
    fmt.PrintTable({"Name", "Description"}, rows);
    return kExitSuccess;
}

int RunDescribe(const ToolRegistry& registry,
                const OutputFormatter& fmt,
                const std::string& name) {
    auto tool = registry.Lookup(name);
    if (!tool) {
        auto error = ToolError::NotFound(name);
        fmt.PrintError(error);
        return error.ExitCode();
    }
    nlohmann::json description = {
        {"name", tool->Name()},
        {"description", tool->Description()},
        {"inputSchema", tool->InputSchema()},
    };
    fmt.PrintJson(description);
    return kExitSuccess;
}

int RunCall(const ToolRegistry& registry,
            const OutputFormatter& fmt,
            const std::string& name,
            const std::string& arguments_json) {
    nlohmann::json args;
    try {
        args = nlohmann::json::parse(arguments_json);
    } catch (const nlohmann::json::exception& e) {
        // parse_error, or out_of_range for numbers such as 1e999.
        auto error = ToolError::InvalidArguments(
            name, "Arguments are not valid JSON: " + std::string(e.what()));
        fmt.PrintError(error);
        return error.ExitCode();
    }

    auto result = registry.Execute(name, args);
    if (result.IsErr()) {
        LogDebug(kComponent, result.Error().ToString());
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    fmt.PrintToolResult(result.Value());
    return result.Value().IsSuccess() ? kExitSuccess : kExitToolFailed;
}

} // namespace remodern
