#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// ToolErrorKind — classifies tool failures for exit codes and the protocol
// error channel.
// ---------------------------------------------------------------------------
enum class ToolErrorKind {
    RegistrationConflict,
    ToolNotFound,
    InvalidArguments,
    ExecutionFailed,
    Internal,
};

// ---------------------------------------------------------------------------
// ToolError — structured failure correlated to at most one tool.
//
// tool_name is absent for framework-level failures (unknown tool, null tool
// passed to the registry). cause chains the underlying failure, e.g. the
// exception text when a tool threw instead of returning an error.
// ---------------------------------------------------------------------------
struct ToolError {
    ToolErrorKind kind = ToolErrorKind::Internal;
    std::optional<std::string> tool_name;
    std::optional<std::string> error_code;
    std::string message;
    std::shared_ptr<const ToolError> cause;

    // -- Factories ------------------------------------------------------------

    static ToolError NotFound(const std::string& name);
    static ToolError Conflict(const std::string& name);
    static ToolError InvalidArguments(std::optional<std::string> tool_name,
                                      std::string message);
    static ToolError ExecutionFailed(std::string tool_name,
                                     std::string message,
                                     std::optional<std::string> error_code = std::nullopt);

    /// Wrap an exception that escaped a tool. The exception text becomes
    /// the cause, so the top-level message stays stable for callers.
    static ToolError FromException(const std::string& tool_name,
                                   const std::exception& e);

    /// Same as FromException, for values thrown that are not std::exception.
    static ToolError FromUnknownException(const std::string& tool_name);

    /// Return a copy of this error with `cause` chained underneath.
    [[nodiscard]] ToolError CausedBy(ToolError cause) const;

    // -- Rendering ------------------------------------------------------------

    [[nodiscard]] bool IsToolScoped() const noexcept { return tool_name.has_value(); }

    [[nodiscard]] int ExitCode() const noexcept;
    [[nodiscard]] std::string CategoryName() const;

    // "ToolError [tool] (code): message"
    [[nodiscard]] std::string ToString() const;

    // Message followed by each cause: "a: b: c".
    [[nodiscard]] std::string FullMessage() const;

    [[nodiscard]] nlohmann::json ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const ToolError& e) {
        return os << e.ToString();
    }

    bool operator==(const ToolError& other) const;
    bool operator!=(const ToolError& other) const { return !(*this == other); }
};

} // namespace remodern
