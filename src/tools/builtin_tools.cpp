#include <remodern/tools/builtin_tools.hpp>

#include <remodern/core/log.hpp>
#include <remodern/mcp/input_schema.hpp>

#include <algorithm>
#include <functional>
#include <memory>

namespace remodern {

// ---------------------------------------------------------------------------
// TestTool
// ---------------------------------------------------------------------------

Result<TestTool::Args, ToolError> TestTool::Args::Parse(const nlohmann::json& args) {
    if (args.contains("message") && !args["message"].is_string()) {
        return Result<Args, ToolError>::Err(ToolError::InvalidArguments(
            std::string(kName), "Parameter 'message' must be of type string"));
    }
    return Result<Args, ToolError>::Ok(Args{OptString(args, "message", kDefaultMessage)});
}

std::string TestTool::Description() const {
    return "A simple test tool that echoes a message back";
}

nlohmann::json TestTool::InputSchema() const {
    return MakeSchema({{"message", StringProp("Test message")}});
}

Result<void, ToolError> TestTool::ValidateArgs(const nlohmann::json& args) const {
    auto base = ITool::ValidateArgs(args);
    if (base.IsErr()) {
        return base;
    }
    return CheckArgsAgainstSchema(Name(), InputSchema(), args);
}

Result<ToolResult, ToolError> TestTool::Execute(const nlohmann::json& args) const {
    return Args::Parse(args).Map([](Args parsed) {
        return ToolResult::Success("Test tool response: " + parsed.message);
    });
}

// ---------------------------------------------------------------------------
// Bootstrap
// ---------------------------------------------------------------------------

namespace {

using ToolFactory = std::function<std::shared_ptr<const ITool>()>;

const std::vector<std::pair<std::string, ToolFactory>>& BuiltinFactories() {
    static const std::vector<std::pair<std::string, ToolFactory>> factories = {
        {TestTool::kName, [] { return std::make_shared<TestTool>(); }},
    };
    return factories;
}

} // anonymous namespace

Result<void, ToolError> RegisterBuiltinTools(ToolRegistry& registry,
                                             const std::vector<std::string>& disabled) {
    std::size_t count = 0;
    for (const auto& [name, factory] : BuiltinFactories()) {
        if (std::find(disabled.begin(), disabled.end(), name) != disabled.end()) {
            LogInfo("bootstrap", "Skipping disabled tool '" + name + "'");
            continue;
        }
        auto registered = registry.Register(factory());
        if (registered.IsErr()) {
            LogError("bootstrap", registered.Error().ToString());
            return registered;
        }
        ++count;
    }
    LogInfo("bootstrap", "Registered " + std::to_string(count) + " built-in tools");
    return Result<void, ToolError>::Ok();
}

} // namespace remodern
