#include <remodern/core/tool_error.hpp>

#include <sstream>

namespace remodern {

ToolError ToolError::NotFound(const std::string& name) {
    ToolError e;
    e.kind = ToolErrorKind::ToolNotFound;
    e.message = "Tool not found: " + name;
    return e;
}

ToolError ToolError::Conflict(const std::string& name) {
    ToolError e;
    e.kind = ToolErrorKind::RegistrationConflict;
    e.message = "Tool with name '" + name + "' already exists";
    return e;
}

ToolError ToolError::InvalidArguments(std::optional<std::string> tool_name,
                                      std::string message) {
    ToolError e;
    e.kind = ToolErrorKind::InvalidArguments;
    e.tool_name = std::move(tool_name);
    e.error_code = "invalid_arguments";
    e.message = std::move(message);
    return e;
}

ToolError ToolError::ExecutionFailed(std::string tool_name,
                                     std::string message,
                                     std::optional<std::string> error_code) {
    ToolError e;
    e.kind = ToolErrorKind::ExecutionFailed;
    e.tool_name = std::move(tool_name);
    e.error_code = std::move(error_code);
    e.message = std::move(message);
    return e;
}

namespace {

ToolError UnexpectedException(const std::string& tool_name, std::string what) {
    ToolError cause;
    cause.kind = ToolErrorKind::Internal;
    cause.message = std::move(what);

    ToolError e;
    e.kind = ToolErrorKind::Internal;
    e.tool_name = tool_name;
    e.error_code = "unexpected_exception";
    e.message = "Tool '" + tool_name + "' raised an unexpected exception";
    e.cause = std::make_shared<const ToolError>(std::move(cause));
    return e;
}

} // anonymous namespace

ToolError ToolError::FromException(const std::string& tool_name,
                                   const std::exception& ex) {
    return UnexpectedException(tool_name, ex.what());
}

ToolError ToolError::FromUnknownException(const std::string& tool_name) {
    return UnexpectedException(tool_name, "unknown exception");
}

ToolError ToolError::CausedBy(ToolError cause) const {
    ToolError copy = *this;
    copy.cause = std::make_shared<const ToolError>(std::move(cause));
    return copy;
}

int ToolError::ExitCode() const noexcept {
    switch (kind) {
        case ToolErrorKind::ToolNotFound:         return 2;
        case ToolErrorKind::RegistrationConflict: return 3;
        case ToolErrorKind::InvalidArguments:     return 4;
        case ToolErrorKind::ExecutionFailed:      return 5;
        case ToolErrorKind::Internal:             return 99;
    }
    return 99;
}

std::string ToolError::CategoryName() const {
    switch (kind) {
        case ToolErrorKind::ToolNotFound:         return "tool_not_found";
        case ToolErrorKind::RegistrationConflict: return "registration_conflict";
        case ToolErrorKind::InvalidArguments:     return "invalid_arguments";
        case ToolErrorKind::ExecutionFailed:      return "execution_failed";
        case ToolErrorKind::Internal:             return "internal";
    }
    return "internal";
}

std::string ToolError::ToString() const {
    std::ostringstream oss;
    oss << "ToolError";
    if (tool_name) {
        oss << " [" << *tool_name << "]";
    }
    if (error_code) {
        oss << " (" << *error_code << ")";
    }
    oss << ": " << message;
    return oss.str();
}

std::string ToolError::FullMessage() const {
    std::string out = message;
    for (auto c = cause; c; c = c->cause) {
        out += ": " + c->message;
    }
    return out;
}

nlohmann::json ToolError::ToJson() const {
    nlohmann::json j = {
        {"category", CategoryName()},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (tool_name) {
        j["tool"] = *tool_name;
    }
    if (error_code) {
        j["code"] = *error_code;
    }
    if (cause) {
        j["cause"] = cause->ToJson();
    }
    return j;
}

bool ToolError::operator==(const ToolError& other) const {
    if (kind != other.kind || tool_name != other.tool_name ||
        error_code != other.error_code || message != other.message) {
        return false;
    }
    if (!cause || !other.cause) {
        return !cause && !other.cause;
    }
    return *cause == *other.cause;
}

} // namespace remodern
