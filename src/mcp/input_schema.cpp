#include <remodern/mcp/input_schema.hpp>

#include <algorithm>

namespace remodern {

namespace {

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string")  return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number")  return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "null")    return value.is_null();
    // Unknown type keywords are not ours to reject.
    return true;
}

// "type" may be a single name or a list of alternatives.
bool MatchesAnyType(const nlohmann::json& value, const nlohmann::json& type) {
    if (type.is_string()) {
        return MatchesType(value, type.get<std::string>());
    }
    if (type.is_array()) {
        for (const auto& t : type) {
            if (t.is_string() && MatchesType(value, t.get<std::string>())) {
                return true;
            }
        }
        return false;
    }
    return true;
}

std::string TypeLabel(const nlohmann::json& type) {
    return type.is_string() ? type.get<std::string>() : type.dump();
}

Result<void, ToolError> Invalid(const std::string& tool_name,
                                const std::string& message) {
    return Result<void, ToolError>::Err(
        ToolError::InvalidArguments(tool_name, message));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json IntProp(const std::string& description) {
    return {{"type", "integer"}, {"description", description}};
}

nlohmann::json BoolProp(const std::string& description) {
    return {{"type", "boolean"}, {"description", description}};
}

nlohmann::json ObjectProp(const std::string& description) {
    return {{"type", "object"}, {"description", description}};
}

nlohmann::json ArrayProp(const std::string& description,
                         const std::string& item_type) {
    return {{"type", "array"},
            {"items", {{"type", item_type}}},
            {"description", description}};
}

nlohmann::json EnumProp(const std::string& description,
                        const std::vector<std::string>& values) {
    return {{"type", "string"},
            {"enum", values},
            {"description", description}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const std::vector<std::string>& required) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

// ---------------------------------------------------------------------------
// CheckArgsAgainstSchema
// ---------------------------------------------------------------------------

Result<void, ToolError> CheckArgsAgainstSchema(const std::string& tool_name,
                                               const nlohmann::json& schema,
                                               const nlohmann::json& args) {
    if (!args.is_object()) {
        return Invalid(tool_name, "Arguments must be an object");
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& key : schema["required"]) {
            if (key.is_string() && !args.contains(key.get<std::string>())) {
                return Invalid(tool_name, "Missing required parameter: " +
                                              key.get<std::string>());
            }
        }
    }

    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return Result<void, ToolError>::Ok();
    }

    for (const auto& [key, prop] : schema["properties"].items()) {
        auto it = args.find(key);
        if (it == args.end() || !prop.is_object()) {
            continue;
        }
        if (prop.contains("type") && !MatchesAnyType(*it, prop["type"])) {
            return Invalid(tool_name, "Parameter '" + key + "' must be of type " +
                                          TypeLabel(prop["type"]));
        }
        if (prop.contains("enum") && prop["enum"].is_array()) {
            const auto& allowed = prop["enum"];
            if (std::find(allowed.begin(), allowed.end(), *it) == allowed.end()) {
                return Invalid(tool_name, "Parameter '" + key + "' must be one of " +
                                              allowed.dump() + ", got " + it->dump());
            }
        }
    }

    return Result<void, ToolError>::Ok();
}

// ---------------------------------------------------------------------------
// Typed accessors
// ---------------------------------------------------------------------------

Result<std::string, ToolError> RequireString(const std::string& tool_name,
                                             const nlohmann::json& args,
                                             const std::string& key) {
    if (!args.contains(key) || !args[key].is_string() ||
        args[key].get<std::string>().empty()) {
        return Result<std::string, ToolError>::Err(ToolError::InvalidArguments(
            tool_name, "Missing required parameter: " + key));
    }
    return Result<std::string, ToolError>::Ok(args[key].get<std::string>());
}

std::string OptString(const nlohmann::json& args, const std::string& key,
                      const std::string& default_value) {
    if (args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return default_value;
}

} // namespace remodern
