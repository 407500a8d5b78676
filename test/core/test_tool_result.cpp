#include <catch2/catch_test_macros.hpp>

#include <remodern/core/tool_result.hpp>

#include <string>
#include <vector>

using namespace remodern;

TEST_CASE("ToolResult: plain success", "[tool_result]") {
    auto r = ToolResult::Success("done");
    CHECK(r.IsSuccess());
    CHECK(r.Content() == "done");
    CHECK_FALSE(r.Metadata().has_value());
    CHECK(r.Artifacts().empty());
    CHECK(r.ErrorMessage().empty());
}

TEST_CASE("ToolResult: success with metadata", "[tool_result]") {
    auto r = ToolResult::Success("done", {{"files", 3}});
    REQUIRE(r.Metadata().has_value());
    CHECK((*r.Metadata())["files"] == 3);
}

TEST_CASE("ToolResult: null metadata means none", "[tool_result]") {
    auto r = ToolResult::Success("done", nullptr);
    CHECK_FALSE(r.Metadata().has_value());
}

TEST_CASE("ToolResult: success with artifacts keeps order", "[tool_result]") {
    auto r = ToolResult::SuccessWithArtifacts("generated", {"b.java", "a.java"});
    CHECK(r.IsSuccess());
    CHECK(r.Artifacts() == std::vector<std::string>{"b.java", "a.java"});
    CHECK_FALSE(r.Metadata().has_value());
}

TEST_CASE("ToolResult: artifacts with metadata", "[tool_result]") {
    auto r = ToolResult::SuccessWithArtifacts("generated", {"a.java"}, {{"classes", 1}});
    CHECK(r.IsSuccess());
    REQUIRE(r.Metadata());
    CHECK((*r.Metadata())["classes"] == 1);
    CHECK(r.Artifacts() == std::vector<std::string>{"a.java"});
}

TEST_CASE("ToolResult: failure", "[tool_result]") {
    auto r = ToolResult::Failure("out of memory");
    CHECK_FALSE(r.IsSuccess());
    CHECK(r.ErrorMessage() == "out of memory");
    CHECK(r.Content().empty());
    CHECK(r.Artifacts().empty());
}
