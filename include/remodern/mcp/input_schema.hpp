#pragma once

#include <remodern/core/result.hpp>
#include <remodern/core/tool_error.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// JSON Schema builders for ITool::InputSchema().
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& description);
nlohmann::json IntProp(const std::string& description);
nlohmann::json BoolProp(const std::string& description);
nlohmann::json ObjectProp(const std::string& description);
nlohmann::json ArrayProp(const std::string& description,
                         const std::string& item_type = "string");
nlohmann::json EnumProp(const std::string& description,
                        const std::vector<std::string>& values);

// {"type":"object","properties":...,"required":[...]}
nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const std::vector<std::string>& required = {});

// ---------------------------------------------------------------------------
// CheckArgsAgainstSchema — validate an argument object against the subset of
// JSON Schema that tool schemas use: required keys, the "type" of each
// declared property, and "enum" membership. Undeclared keys are accepted.
// ---------------------------------------------------------------------------
Result<void, ToolError> CheckArgsAgainstSchema(const std::string& tool_name,
                                               const nlohmann::json& schema,
                                               const nlohmann::json& args);

// -- Typed argument accessors, used by a tool's Args::Parse -----------------

Result<std::string, ToolError> RequireString(const std::string& tool_name,
                                             const nlohmann::json& args,
                                             const std::string& key);

std::string OptString(const nlohmann::json& args, const std::string& key,
                      const std::string& default_value = "");

} // namespace remodern
