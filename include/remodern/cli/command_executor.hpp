#pragma once

#include <remodern/cli/output_formatter.hpp>
#include <remodern/mcp/tool_registry.hpp>

#include <string>

namespace remodern {

constexpr int kExitSuccess    = 0;
constexpr int kExitToolFailed = 1;

// ---------------------------------------------------------------------------
// One-shot CLI commands run against a populated registry.
//
// Output goes through the formatter, so tests can construct it over string
// streams. Each function returns the process exit code:
//   0            success
//   1            the tool ran and returned a failed ToolResult
//   ExitCode()   a ToolError (2 not found, 4 invalid arguments, 5 execution
//                failed, 99 internal)
// ---------------------------------------------------------------------------

// Name and description of every registered tool, sorted by name.
int RunListTools(const ToolRegistry& registry, const OutputFormatter& fmt);

// Name, description and input schema of one tool as pretty JSON.
int RunDescribe(const ToolRegistry& registry,
                const OutputFormatter& fmt,
                const std::string& name);

// Parse arguments_json and execute the tool once.
int RunCall(const ToolRegistry& registry,
            const OutputFormatter& fmt,
            const std::string& name,
            const std::string& arguments_json);

} // namespace remodern
