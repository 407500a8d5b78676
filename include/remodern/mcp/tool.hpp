#pragma once

#include <remodern/core/result.hpp>
#include <remodern/core/tool_error.hpp>
#include <remodern/core/tool_result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// ITool — the capability interface every pluggable tool implements.
//
// Tools are stateless between invocations, so every method is const and a
// single instance may be executed from several threads at once. Tools never
// throw across this interface: failures come back as ToolError, and a tool
// that detects a business-level problem may instead return
// ToolResult::Failure. ToolRegistry converts any exception that does escape
// into an Internal ToolError.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    // Unique, non-empty identifier used for lookup and protocol routing.
    [[nodiscard]] virtual std::string Name() const = 0;

    [[nodiscard]] virtual std::string Description() const = 0;

    // JSON Schema object describing the accepted arguments. Must be
    // renderable without invoking the tool.
    [[nodiscard]] virtual nlohmann::json InputSchema() const = 0;

    // Reject unusable arguments before any side effect. The default accepts
    // any JSON object and rejects null and non-object values; overrides
    // should call it first.
    [[nodiscard]] virtual Result<void, ToolError> ValidateArgs(
        const nlohmann::json& args) const;

    [[nodiscard]] virtual Result<ToolResult, ToolError> Execute(
        const nlohmann::json& args) const = 0;
};

} // namespace remodern
