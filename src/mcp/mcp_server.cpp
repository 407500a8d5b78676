#include <remodern/mcp/mcp_server.hpp>

#include <remodern/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <exception>

namespace remodern {

namespace {

constexpr const char* kComponent = "mcp";

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

// Never throws on invalid UTF-8 coming back from a tool.
std::string Serialize(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

nlohmann::json ToolResultToJson(const ToolResult& result) {
    nlohmann::json payload;
    if (!result.IsSuccess()) {
        payload["content"] = TextContent("Error: " + result.ErrorMessage());
        payload["isError"] = true;
        return payload;
    }

    payload["content"] = TextContent(result.Content());

    nlohmann::json meta;
    if (result.Metadata()) {
        // meta must stay an object; other metadata values go under "value".
        if (result.Metadata()->is_object()) {
            meta = *result.Metadata();
        } else {
            meta["value"] = *result.Metadata();
        }
    }
    if (!result.Artifacts().empty()) {
        meta["artifacts"] = result.Artifacts();
    }
    if (!meta.is_null()) {
        payload["meta"] = std::move(meta);
    }
    return payload;
}

nlohmann::json MakeRpcResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeRpcError(const nlohmann::json& id, int code,
                            const std::string& message,
                            const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", std::move(error)}
    };
}

McpServer::McpServer(ToolRegistry& registry,
                     ServerInfo info,
                     std::istream& in,
                     std::ostream& out)
    : registry_(registry), info_(std::move(info)), in_(in), out_(out) {}

std::size_t McpServer::Run() {
    LogInfo(kComponent, "Serving " + std::to_string(registry_.Size()) +
                            " tools: " + info_.name + " " + info_.version);

    std::size_t handled = 0;
    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (!response) {
            continue;
        }
        out_ << Serialize(*response) << "\n";
        out_.flush();
        ++handled;
        if (!out_) {
            LogError(kComponent, "Output stream failed, stopping server");
            break;
        }
    }

    LogInfo(kComponent, "Input closed after " + std::to_string(handled) + " requests");
    return handled;
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    if (IsBlank(line)) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        // parse_error, but also out_of_range for numbers such as 1e999.
        LogWarn(kComponent, std::string("Unparseable request: ") + e.what());
        return MakeRpcError(nullptr, rpc_error::kParseError, "Parse error");
    }

    nlohmann::json id = nullptr;
    if (message.is_object() && message.contains("id")) {
        id = message["id"];
    }

    try {
        return HandleMessage(message);
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Request failed: ") + e.what());
        return MakeRpcError(id, rpc_error::kInternalError, "Internal error");
    } catch (...) {
        LogError(kComponent, "Request failed: unknown exception");
        return MakeRpcError(id, rpc_error::kInternalError, "Internal error");
    }
}

nlohmann::json McpServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeRpcError(nullptr, rpc_error::kInvalidRequest,
                            "Invalid Request: expected a JSON object");
    }

    nlohmann::json id = message.contains("id") ? message["id"] : nlohmann::json(nullptr);

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return MakeRpcError(id, rpc_error::kInvalidRequest,
                            "Invalid Request: missing 'method'");
    }
    auto method = method_it->get<std::string>();

    static const nlohmann::json kNoParams = nlohmann::json::object();
    auto params_it = message.find("params");
    const auto& params = (params_it != message.end() && params_it->is_object())
                             ? *params_it
                             : kNoParams;

    LogDebug(kComponent, "Request: " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeRpcError(id, rpc_error::kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& params,
                                           const nlohmann::json& id) const {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        LogInfo(kComponent, "Client: " + client.value("name", std::string("unknown")) +
                                " " + client.value("version", std::string("")));
    }

    nlohmann::json result;
    result["protocolVersion"] = info_.protocol_version;
    result["capabilities"] = {
        {"tools", {{"listChanged", true}}}
    };
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    return MakeRpcResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : registry_.ListTools()) {
        tools.push_back({
            {"name", tool->Name()},
            {"description", tool->Description()},
            {"inputSchema", tool->InputSchema()}
        });
    }
    return MakeRpcResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) const {
    auto name_it = params.find("name");
    if (name_it == params.end()) {
        return MakeRpcError(id, rpc_error::kInvalidParams, "Missing 'name' parameter");
    }
    if (!name_it->is_string()) {
        return MakeRpcError(id, rpc_error::kInvalidParams,
                            "Parameter 'name' must be a string");
    }

    // Absent arguments stay null so the tool's validation decides.
    nlohmann::json arguments = params.contains("arguments")
                                   ? params["arguments"]
                                   : nlohmann::json(nullptr);

    auto outcome = registry_.Execute(name_it->get<std::string>(), arguments);
    if (outcome.IsErr()) {
        return ToolErrorResponse(id, outcome.Error());
    }
    return MakeRpcResult(id, ToolResultToJson(outcome.Value()));
}

nlohmann::json McpServer::ToolErrorResponse(const nlohmann::json& id,
                                            const ToolError& error) const {
    switch (error.kind) {
        case ToolErrorKind::ExecutionFailed:
            return MakeRpcResult(id, {
                {"content", TextContent("Error: " + error.FullMessage())},
                {"isError", true}
            });
        case ToolErrorKind::ToolNotFound:
        case ToolErrorKind::InvalidArguments:
            return MakeRpcError(id, rpc_error::kInvalidParams,
                                error.FullMessage(), error.ToJson());
        case ToolErrorKind::RegistrationConflict:
        case ToolErrorKind::Internal:
            break;
    }
    return MakeRpcError(id, rpc_error::kInternalError,
                        error.FullMessage(), error.ToJson());
}

} // namespace remodern
