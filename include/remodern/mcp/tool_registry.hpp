#pragma once

#include <remodern/core/result.hpp>
#include <remodern/core/tool_error.hpp>
#include <remodern/core/tool_result.hpp>
#include <remodern/mcp/tool.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// ToolRegistry — catalogue of tools and the only path by which a tool runs.
//
// One instance is constructed by main() and passed by reference to every
// front end (stdio server, CLI). All methods are safe to call concurrently:
// reads share a lock, Register/Unregister/Clear take it exclusively, and the
// check-then-insert in Register happens under a single exclusive lock so two
// racing registrations of one name can never both succeed.
//
// Tools are held by shared_ptr. Execute() resolves the tool under the lock
// and runs it after releasing the lock, so a tool unregistered while a call
// is in flight still finishes that call.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Fails with RegistrationConflict if the name is taken, and with
    // InvalidArguments for a null tool or an empty name. State is unchanged
    // on failure.
    [[nodiscard]] Result<void, ToolError> Register(std::shared_ptr<const ITool> tool);

    // Returns true if a tool was removed.
    bool Unregister(const std::string& name);

    // Null if absent.
    [[nodiscard]] std::shared_ptr<const ITool> Lookup(const std::string& name) const;

    [[nodiscard]] bool Has(const std::string& name) const;

    // Snapshots, sorted by name. Later registry changes do not affect them.
    [[nodiscard]] std::vector<std::string> ListNames() const;
    [[nodiscard]] std::vector<std::shared_ptr<const ITool>> ListTools() const;

    // Resolve, validate, execute. Returns the tool's result unchanged.
    // Unknown name -> ToolNotFound without touching any tool; a validation
    // failure stops before Execute; an exception escaping the tool becomes
    // an Internal ToolError.
    [[nodiscard]] Result<ToolResult, ToolError> Execute(
        const std::string& name, const nlohmann::json& args) const;

    [[nodiscard]] std::size_t Size() const;

    // Full reset, for test isolation.
    void Clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const ITool>> tools_;
};

} // namespace remodern
