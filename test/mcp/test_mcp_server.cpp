#include <catch2/catch_test_macros.hpp>

#include <remodern/mcp/mcp_server.hpp>

#include "mocks/mock_tool.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace remodern;
using remodern::testing::MakeEchoTool;
using remodern::testing::MockTool;

namespace {

// Run the server over `input` and return the parsed output lines.
std::vector<nlohmann::json> RunLines(ToolRegistry& registry, const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);
    server.Run();

    std::vector<nlohmann::json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }
    return responses;
}

nlohmann::json Call(const nlohmann::json& id, const std::string& name,
                    const nlohmann::json& arguments) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", name}, {"arguments", arguments}}}
    };
}

} // anonymous namespace

// ===========================================================================
// initialize / tools/list
// ===========================================================================

TEST_CASE("McpServer: initialize returns protocol and server info", "[mcp][server]") {
    ToolRegistry registry;
    ServerInfo info;
    info.name = "demo";
    info.version = "9.9.9";
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, info, in, out);

    auto r = server.HandleMessage({
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "initialize"},
        {"params", {{"clientInfo", {{"name", "inspector"}, {"version", "1"}}}}}
    });

    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["capabilities"]["tools"]["listChanged"] == true);
    CHECK(r["result"]["serverInfo"]["name"] == "demo");
    CHECK(r["result"]["serverInfo"]["version"] == "9.9.9");
}

TEST_CASE("McpServer: tools/list returns name, description and schema", "[mcp][server]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeEchoTool()).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "tools/list"}});

    CHECK(r["id"] == "a");
    auto tools = r["result"]["tools"];
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echoes input");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
    CHECK(tools[0]["inputSchema"]["required"][0] == "message");
}

TEST_CASE("McpServer: tools/list on empty registry", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    CHECK(r["result"]["tools"].is_array());
    CHECK(r["result"]["tools"].empty());
}

TEST_CASE("McpServer: tools/list reflects later registrations", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    REQUIRE(registry.Register(std::make_shared<MockTool>("late")).IsOk());
    auto r = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    REQUIRE(r["result"]["tools"].size() == 1);
    CHECK(r["result"]["tools"][0]["name"] == "late");
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpServer: tools/call success returns text content", "[mcp][server]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeEchoTool()).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage(Call(3, "echo", {{"message", "hi"}}));

    nlohmann::json expected = {
        {"jsonrpc", "2.0"},
        {"id", 3},
        {"result", {
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", "hi"}}})}
        }}
    };
    CHECK(r == expected);
}

TEST_CASE("McpServer: tools/call carries metadata and artifacts as meta", "[mcp][server]") {
    ToolRegistry registry;
    auto with_meta = std::make_shared<MockTool>("meta");
    with_meta->ReturnResult(ToolResult::Success("ok", {{"lines", 42}}));
    auto with_files = std::make_shared<MockTool>("files");
    with_files->ReturnResult(ToolResult::SuccessWithArtifacts("made", {"a.java", "b.java"}));
    REQUIRE(registry.Register(with_meta).IsOk());
    REQUIRE(registry.Register(with_files).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r1 = server.HandleMessage(Call(1, "meta", nlohmann::json::object()));
    CHECK(r1["result"]["meta"]["lines"] == 42);

    auto r2 = server.HandleMessage(Call(2, "files", nlohmann::json::object()));
    CHECK(r2["result"]["content"][0]["text"] == "made");
    CHECK(r2["result"]["meta"]["artifacts"] ==
          nlohmann::json::array({"a.java", "b.java"}));
}

TEST_CASE("McpServer: tools/call failure result sets isError", "[mcp][server]") {
    ToolRegistry registry;
    auto tool = std::make_shared<MockTool>("fails");
    tool->ReturnResult(ToolResult::Failure("disk full"));
    REQUIRE(registry.Register(tool).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage(Call(4, "fails", nlohmann::json::object()));

    CHECK_FALSE(r.contains("error"));
    CHECK(r["result"]["isError"] == true);
    CHECK(r["result"]["content"][0]["text"] == "Error: disk full");
}

TEST_CASE("McpServer: tools/call execution error sets isError", "[mcp][server]") {
    ToolRegistry registry;
    auto tool = std::make_shared<MockTool>("errs");
    tool->ReturnError(ToolError::ExecutionFailed("errs", "upstream down"));
    REQUIRE(registry.Register(tool).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage(Call(5, "errs", nlohmann::json::object()));

    CHECK_FALSE(r.contains("error"));
    CHECK(r["result"]["isError"] == true);
    CHECK(r["result"]["content"][0]["text"] == "Error: upstream down");
}

TEST_CASE("McpServer: tools/call unknown tool is an invalid-params error", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage(Call(6, "nope", nlohmann::json::object()));

    CHECK(r["id"] == 6);
    CHECK_FALSE(r.contains("result"));
    CHECK(r["error"]["code"] == rpc_error::kInvalidParams);
    CHECK(r["error"]["message"] == "Tool not found: nope");
    CHECK(r["error"]["data"]["category"] == "tool_not_found");
}

TEST_CASE("McpServer: tools/call validation failure names the tool", "[mcp][server]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(std::make_shared<MockTool>("plain")).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    nlohmann::json msg = {
        {"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
        {"params", {{"name", "plain"}}}
    };
    auto r = server.HandleMessage(msg);

    CHECK(r["error"]["code"] == rpc_error::kInvalidParams);
    CHECK(r["error"]["message"] == "Arguments cannot be null");
    CHECK(r["error"]["data"]["tool"] == "plain");
}

TEST_CASE("McpServer: tools/call exception is an internal error", "[mcp][server]") {
    ToolRegistry registry;
    auto tool = std::make_shared<MockTool>("throws");
    tool->Throw("kaboom");
    REQUIRE(registry.Register(tool).IsOk());
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage(Call(8, "throws", nlohmann::json::object()));

    CHECK(r["error"]["code"] == rpc_error::kInternalError);
    CHECK(r["error"]["message"].get<std::string>().find("kaboom") != std::string::npos);
    CHECK(r["error"]["data"]["tool"] == "throws");
}

TEST_CASE("McpServer: tools/call missing or non-string name", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto missing = server.HandleMessage({
        {"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
        {"params", nlohmann::json::object()}
    });
    CHECK(missing["error"]["code"] == rpc_error::kInvalidParams);
    CHECK(missing["error"]["message"] == "Missing 'name' parameter");

    auto numeric = server.HandleMessage({
        {"jsonrpc", "2.0"}, {"id", 10}, {"method", "tools/call"},
        {"params", {{"name", 5}}}
    });
    CHECK(numeric["error"]["code"] == rpc_error::kInvalidParams);
}

// ===========================================================================
// Request-level errors
// ===========================================================================

TEST_CASE("McpServer: unknown method", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 11}, {"method", "resources/list"}});
    CHECK(r["id"] == 11);
    CHECK(r["error"]["code"] == rpc_error::kMethodNotFound);
    CHECK(r["error"]["message"] == "Method not found: resources/list");
}

TEST_CASE("McpServer: missing method is an invalid request", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 12}});
    CHECK(r["id"] == 12);
    CHECK(r["error"]["code"] == rpc_error::kInvalidRequest);

    auto not_object = server.HandleMessage(nlohmann::json::array({1, 2}));
    CHECK(not_object["id"].is_null());
    CHECK(not_object["error"]["code"] == rpc_error::kInvalidRequest);
}

TEST_CASE("McpServer: HandleLine parse error has null id", "[mcp][server]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    auto r = server.HandleLine("{not json");
    REQUIRE(r.has_value());
    CHECK((*r)["id"].is_null());
    CHECK((*r)["error"]["code"] == rpc_error::kParseError);
    CHECK((*r)["error"]["message"] == "Parse error");

    CHECK_FALSE(server.HandleLine("").has_value());
    CHECK_FALSE(server.HandleLine("   \t").has_value());
}

// ===========================================================================
// Run loop
// ===========================================================================

TEST_CASE("McpServer: one response per line, in order", "[mcp][server][loop]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeEchoTool()).IsOk());

    std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})" "\n";

    auto responses = RunLines(registry, input);

    REQUIRE(responses.size() == 3);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[2]["id"] == 3);
    CHECK(responses[2]["result"]["content"][0]["text"] == "hi");
}

TEST_CASE("McpServer: malformed line does not stop the loop", "[mcp][server][loop]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeEchoTool()).IsOk());

    std::string input =
        "this is not json\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n";

    auto responses = RunLines(registry, input);

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["error"]["code"] == rpc_error::kParseError);
    CHECK(responses[0]["id"].is_null());
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["tools"].size() == 1);
}

TEST_CASE("McpServer: number overflow is a parse error and the loop continues", "[mcp][server][loop]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeEchoTool()).IsOk());

    std::string input =
        R"({"jsonrpc":"2.0","id":1e999,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n";

    auto responses = RunLines(registry, input);

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["error"]["code"] == rpc_error::kParseError);
    CHECK(responses[0]["id"].is_null());
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["tools"].size() == 1);
}

TEST_CASE("McpServer: non-standard exception from a tool does not stop the loop", "[mcp][server][loop]") {
    ToolRegistry registry;
    auto tool = std::make_shared<MockTool>("boom");
    tool->SetExecute([](const nlohmann::json&) -> Result<ToolResult, ToolError> {
        throw 42;
    });
    REQUIRE(registry.Register(tool).IsOk());

    std::string input =
        Call(1, "boom", nlohmann::json::object()).dump() + "\n" +
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n";

    auto responses = RunLines(registry, input);

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["error"]["code"] == rpc_error::kInternalError);
    CHECK(responses[0]["error"]["message"] ==
          "Tool 'boom' raised an unexpected exception: unknown exception");
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["tools"].size() == 1);
}

TEST_CASE("McpServer: unknown tool does not stop the loop", "[mcp][server][loop]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeEchoTool()).IsOk());

    std::string input =
        Call(1, "missing", nlohmann::json::object()).dump() + "\n" +
        Call(2, "echo", {{"message", "still here"}}).dump() + "\n";

    auto responses = RunLines(registry, input);

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["error"]["code"] == rpc_error::kInvalidParams);
    CHECK(responses[1]["result"]["content"][0]["text"] == "still here");
}

TEST_CASE("McpServer: blank lines are skipped", "[mcp][server][loop]") {
    ToolRegistry registry;

    std::string input =
        "\n"
        "   \n"
        R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
        "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);
    auto handled = server.Run();

    CHECK(handled == 1);
    CHECK(out.str().find("\n") == out.str().size() - 1);
}

TEST_CASE("McpServer: empty input produces no output", "[mcp][server][loop]") {
    ToolRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(registry, ServerInfo{}, in, out);

    CHECK(server.Run() == 0);
    CHECK(out.str().empty());
}

// ===========================================================================
// ToolResultToJson
// ===========================================================================

TEST_CASE("ToolResultToJson: failure text is prefixed", "[mcp][server]") {
    auto j = ToolResultToJson(ToolResult::Failure("nope"));
    CHECK(j["isError"] == true);
    CHECK(j["content"][0]["type"] == "text");
    CHECK(j["content"][0]["text"] == "Error: nope");
}

TEST_CASE("MakeRpcError: data is omitted when null", "[mcp][server]") {
    auto j = MakeRpcError(1, rpc_error::kInternalError, "x");
    CHECK_FALSE(j["error"].contains("data"));

    auto with_data = MakeRpcError(1, rpc_error::kInternalError, "x", {{"k", "v"}});
    CHECK(with_data["error"]["data"]["k"] == "v");
}

TEST_CASE("ToolResultToJson: artifacts kept beside non-object metadata", "[mcp][server]") {
    auto j = ToolResultToJson(ToolResult::Success("ok", nlohmann::json::array({1, 2})));
    CHECK(j["meta"]["value"] == nlohmann::json::array({1, 2}));
    CHECK_FALSE(j["meta"].contains("artifacts"));

    auto both = ToolResultToJson(ToolResult::SuccessWithArtifacts(
        "made", {"A.java"}, nlohmann::json::array({1, 2})));
    CHECK(both["meta"]["value"] == nlohmann::json::array({1, 2}));
    CHECK(both["meta"]["artifacts"] == nlohmann::json::array({"A.java"}));

    auto merged = ToolResultToJson(ToolResult::SuccessWithArtifacts(
        "made", {"A.java"}, {{"lines", 3}}));
    CHECK(merged["meta"] == nlohmann::json{{"lines", 3},
                                           {"artifacts", nlohmann::json::array({"A.java"})}});
}
