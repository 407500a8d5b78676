#include <remodern/mcp/tool.hpp>

namespace remodern {

Result<void, ToolError> ITool::ValidateArgs(const nlohmann::json& args) const {
    if (args.is_null()) {
        return Result<void, ToolError>::Err(
            ToolError::InvalidArguments(Name(), "Arguments cannot be null"));
    }
    if (!args.is_object()) {
        return Result<void, ToolError>::Err(
            ToolError::InvalidArguments(Name(), "Arguments must be an object"));
    }
    return Result<void, ToolError>::Ok();
}

} // namespace remodern
