#include <remodern/core/tool_result.hpp>

namespace remodern {

ToolResult ToolResult::Success(std::string content) {
    ToolResult r;
    r.success_ = true;
    r.content_ = std::move(content);
    return r;
}

ToolResult ToolResult::Success(std::string content, nlohmann::json metadata) {
    ToolResult r = Success(std::move(content));
    // A null metadata value means "no metadata", not an empty object.
    if (!metadata.is_null()) {
        r.metadata_ = std::move(metadata);
    }
    return r;
}

ToolResult ToolResult::SuccessWithArtifacts(std::string content,
                                            std::vector<std::string> artifacts) {
    ToolResult r = Success(std::move(content));
    r.artifacts_ = std::move(artifacts);
    return r;
}

ToolResult ToolResult::SuccessWithArtifacts(std::string content,
                                            std::vector<std::string> artifacts,
                                            nlohmann::json metadata) {
    ToolResult r = Success(std::move(content), std::move(metadata));
    r.artifacts_ = std::move(artifacts);
    return r;
}

ToolResult ToolResult::Failure(std::string error_message) {
    ToolResult r;
    r.success_ = false;
    r.error_message_ = std::move(error_message);
    return r;
}

} // namespace remodern
