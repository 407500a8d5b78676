#include <remodern/mcp/tool_registry.hpp>

#include <remodern/core/log.hpp>

#include <exception>
#include <mutex>

namespace remodern {

namespace {

constexpr const char* kComponent = "registry";

} // anonymous namespace

Result<void, ToolError> ToolRegistry::Register(std::shared_ptr<const ITool> tool) {
    if (!tool) {
        return Result<void, ToolError>::Err(
            ToolError::InvalidArguments(std::nullopt, "Tool cannot be null"));
    }
    auto name = tool->Name();
    if (name.empty()) {
        return Result<void, ToolError>::Err(
            ToolError::InvalidArguments(std::nullopt, "Tool name cannot be empty"));
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = tools_.try_emplace(name, std::move(tool));
        if (!inserted) {
            lock.unlock();
            LogWarn(kComponent, "Rejected duplicate registration of '" + name + "'");
            return Result<void, ToolError>::Err(ToolError::Conflict(name));
        }
    }

    LogDebug(kComponent, "Registered tool '" + name + "'");
    return Result<void, ToolError>::Ok();
}

bool ToolRegistry::Unregister(const std::string& name) {
    std::size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        removed = tools_.erase(name);
    }
    if (removed > 0) {
        LogDebug(kComponent, "Unregistered tool '" + name + "'");
    }
    return removed > 0;
}

std::shared_ptr<const ITool> ToolRegistry::Lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ToolRegistry::Has(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::ListNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::shared_ptr<const ITool>> ToolRegistry::ListTools() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<const ITool>> tools;
    tools.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        tools.push_back(tool);
    }
    return tools;
}

Result<ToolResult, ToolError> ToolRegistry::Execute(
    const std::string& name, const nlohmann::json& args) const {
    auto tool = Lookup(name);
    if (!tool) {
        LogWarn(kComponent, "Tool not found: " + name);
        return Result<ToolResult, ToolError>::Err(ToolError::NotFound(name));
    }

    LogDebug(kComponent, "Executing tool '" + name + "'");
    try {
        auto valid = tool->ValidateArgs(args);
        if (valid.IsErr()) {
            LogWarn(kComponent, "Validation failed for '" + name + "': " +
                                    valid.Error().message);
            return Result<ToolResult, ToolError>::Err(std::move(valid).Error());
        }

        auto result = tool->Execute(args);
        if (result.IsErr()) {
            LogWarn(kComponent, result.Error().ToString());
        } else if (!result.Value().IsSuccess()) {
            LogInfo(kComponent, "Tool '" + name + "' reported failure: " +
                                    result.Value().ErrorMessage());
        }
        return result;
    } catch (const std::exception& e) {
        LogError(kComponent, "Tool '" + name + "' threw: " + e.what());
        return Result<ToolResult, ToolError>::Err(ToolError::FromException(name, e));
    } catch (...) {
        LogError(kComponent, "Tool '" + name + "' threw a non-standard exception");
        return Result<ToolResult, ToolError>::Err(ToolError::FromUnknownException(name));
    }
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

void ToolRegistry::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tools_.clear();
}

} // namespace remodern
