#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// ToolResult — immutable outcome of one tool invocation.
//
// A successful result carries text content and, optionally, structured
// metadata and the paths of files the tool produced. A failed result
// carries only an error message. Build through the factories; there is
// no way to mutate a result afterwards.
// ---------------------------------------------------------------------------
class ToolResult {
public:
    static ToolResult Success(std::string content);
    static ToolResult Success(std::string content, nlohmann::json metadata);
    static ToolResult SuccessWithArtifacts(std::string content,
                                           std::vector<std::string> artifacts);
    static ToolResult SuccessWithArtifacts(std::string content,
                                           std::vector<std::string> artifacts,
                                           nlohmann::json metadata);
    static ToolResult Failure(std::string error_message);

    [[nodiscard]] bool IsSuccess() const noexcept { return success_; }
    [[nodiscard]] const std::string& Content() const noexcept { return content_; }
    [[nodiscard]] const std::optional<nlohmann::json>& Metadata() const noexcept {
        return metadata_;
    }
    [[nodiscard]] const std::vector<std::string>& Artifacts() const noexcept {
        return artifacts_;
    }
    [[nodiscard]] const std::string& ErrorMessage() const noexcept {
        return error_message_;
    }

private:
    ToolResult() = default;

    bool success_ = false;
    std::string content_;
    std::optional<nlohmann::json> metadata_;
    std::vector<std::string> artifacts_;
    std::string error_message_;
};

} // namespace remodern
