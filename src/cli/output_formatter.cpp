#include <remodern/cli/output_formatter.hpp>
#include <remodern/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace remodern {

namespace {

using namespace remodern::ansi;

std::string Dump(const nlohmann::json& value, int indent = -1) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << Dump(array) << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < headers.size() && c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            // No padding after the last column.
            if (c + 1 == headers.size()) {
                out_ << cells[c];
            } else {
                out_ << std::left << std::setw(static_cast<int>(widths[c]))
                     << cells[c];
            }
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& value) const {
    out_ << Dump(value, 2) << "\n";
}

void OutputFormatter::PrintToolResult(const ToolResult& result) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = result.IsSuccess();
        if (result.IsSuccess()) {
            j["content"] = result.Content();
            if (result.Metadata()) {
                j["metadata"] = *result.Metadata();
            }
            if (!result.Artifacts().empty()) {
                j["artifacts"] = result.Artifacts();
            }
            out_ << Dump(j) << "\n";
        } else {
            j["error"] = result.ErrorMessage();
            err_ << Dump(j) << "\n";
        }
        return;
    }

    if (!result.IsSuccess()) {
        if (color_mode_) {
            err_ << kRed << "Error: " << kReset << result.ErrorMessage() << "\n";
        } else {
            err_ << "Error: " << result.ErrorMessage() << "\n";
        }
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "Success: " << kReset << result.Content() << "\n";
    } else {
        out_ << "Success: " << result.Content() << "\n";
    }

    if (result.Metadata()) {
        out_ << (color_mode_ ? std::string(kBold) + "Metadata:" + kReset : "Metadata:")
             << " " << Dump(*result.Metadata()) << "\n";
    }

    if (!result.Artifacts().empty()) {
        out_ << (color_mode_ ? std::string(kBold) + "Generated files:" + kReset
                             : "Generated files:")
             << "\n";
        for (const auto& path : result.Artifacts()) {
            out_ << "  - " << path << "\n";
        }
    }
}

void OutputFormatter::PrintError(const ToolError& error) const {
    if (json_mode_) {
        err_ << Dump(error.ToJson()) << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.CategoryName() << kReset;
        if (error.tool_name) {
            err_ << kDim << " [" << *error.tool_name << "]" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.FullMessage() << "\n";
        if (error.error_code) {
            err_ << "  " << kDim << "Code: " << kReset << *error.error_code << "\n";
        }
        return;
    }

    err_ << "Error: " << error.CategoryName();
    if (error.tool_name) {
        err_ << " [" << *error.tool_name << "]";
    }
    err_ << "\n";
    err_ << "  " << error.FullMessage() << "\n";
    if (error.error_code) {
        err_ << "  Code: " << *error.error_code << "\n";
    }
}

void OutputFormatter::PrintError(const std::string& message) const {
    if (json_mode_) {
        err_ << Dump(nlohmann::json{{"category", "config"}, {"message", message}}) << "\n";
        return;
    }
    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << message << "\n";
        return;
    }
    err_ << "Error: " << message << "\n";
}

} // namespace remodern
