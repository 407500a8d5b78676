#pragma once

#include <remodern/core/tool_error.hpp>
#include <remodern/core/tool_result.hpp>
#include <remodern/core/version.hpp>
#include <remodern/mcp/tool_registry.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace remodern {

// JSON-RPC 2.0 error codes used by the server.
namespace rpc_error {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
} // namespace rpc_error

// Static metadata reported by "initialize".
struct ServerInfo {
    std::string name = kProgramName;
    std::string version = kVersion;
    std::string protocol_version = "2024-11-05";
};

// ---------------------------------------------------------------------------
// McpServer — line-delimited JSON-RPC 2.0 front end for a ToolRegistry.
//
// Methods:
//   - initialize   server and protocol metadata
//   - tools/list   {name, description, inputSchema} for every tool
//   - tools/call   ToolRegistry::Execute(params.name, params.arguments)
//
// Every non-blank input line produces exactly one output line, in order.
// A malformed line or a failing request never stops the loop; only end of
// input (or a broken output stream) does. Several servers may run at once
// over the same registry, one per stream pair.
//
// Failure channels for tools/call: failures the tool itself reports (a
// ToolResult::Failure, or a ToolError of kind ExecutionFailed) come back as
// a normal result with isError=true. Framework failures (unknown tool,
// argument validation, an exception escaping the tool) come back as a
// JSON-RPC error object.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry& registry,
              ServerInfo info = {},
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Serve until EOF. Returns the number of requests answered.
    std::size_t Run();

    // One raw input line -> its response. nullopt for blank lines only.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    // One parsed request -> its response.
    [[nodiscard]] nlohmann::json HandleMessage(const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id) const;
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;
    nlohmann::json ToolErrorResponse(const nlohmann::json& id,
                                     const ToolError& error) const;

    ToolRegistry& registry_;
    ServerInfo info_;
    std::istream& in_;
    std::ostream& out_;
};

// MCP "tools/call" result payload for a ToolResult:
//   success: {"content":[{"type":"text","text":...}], "meta"?: {...}}
//   failure: {"content":[{"type":"text","text":"Error: ..."}], "isError":true}
// Artifacts are reported as meta.artifacts; metadata that is not an object
// is reported as meta.value.
nlohmann::json ToolResultToJson(const ToolResult& result);

nlohmann::json MakeRpcResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeRpcError(const nlohmann::json& id, int code,
                            const std::string& message,
                            const nlohmann::json& data = nullptr);

} // namespace remodern
