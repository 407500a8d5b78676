#pragma once

#include <remodern/core/tool_error.hpp>
#include <remodern/core/tool_result.hpp>

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace remodern {

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON output for the CLI commands.
//
// Results go to `out`, errors to `err`. When color_mode is true and
// json_mode is false, tables are rendered with FTXUI and messages use
// ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Print a table with headers and rows.
    // In JSON mode, outputs a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Pretty-print a JSON document to stdout.
    void PrintJson(const nlohmann::json& value) const;

    // Success: content, then metadata and generated files when present.
    // Failure: "Error: <message>" on stderr.
    void PrintToolResult(const ToolResult& result) const;

    void PrintError(const ToolError& error) const;

    // Errors raised before any tool is involved (bad flags, bad config).
    void PrintError(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace remodern
