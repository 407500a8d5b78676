#pragma once

#include <remodern/core/result.hpp>
#include <remodern/core/tool_error.hpp>
#include <remodern/mcp/tool.hpp>
#include <remodern/mcp/tool_registry.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// TestTool — "test": round-trips a message, for checking a client setup.
// ---------------------------------------------------------------------------
class TestTool : public ITool {
public:
    static constexpr const char* kName = "test";
    static constexpr const char* kDefaultMessage = "Hello from ReModern!";

    struct Args {
        std::string message;

        static Result<Args, ToolError> Parse(const nlohmann::json& args);
    };

    [[nodiscard]] std::string Name() const override { return kName; }
    [[nodiscard]] std::string Description() const override;
    [[nodiscard]] nlohmann::json InputSchema() const override;
    [[nodiscard]] Result<void, ToolError> ValidateArgs(
        const nlohmann::json& args) const override;
    [[nodiscard]] Result<ToolResult, ToolError> Execute(
        const nlohmann::json& args) const override;
};

// Register every built-in tool whose name is not in `disabled`. Stops at the
// first failure (e.g. a name already taken) and returns it.
Result<void, ToolError> RegisterBuiltinTools(ToolRegistry& registry,
                                             const std::vector<std::string>& disabled = {});

} // namespace remodern
