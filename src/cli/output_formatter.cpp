#include <cfgref/cli/output_formatter.hpp>
#include <cfgref/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace cfgref {

namespace {

std::string DumpJson(const nlohmann::ordered_json& json) {
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

// "reference_not_found" -> "Reference not found"
std::string Headline(const Error& error) {
    std::string text = error.CategoryName();
    for (auto& c : text) {
        if (c == '_') c = ' ';
    }
    if (!text.empty()) {
        text.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(text.front())));
    }
    return text;
}

using Row = std::vector<std::string>;

std::string JsonTable(const Row& headers, const std::vector<Row>& rows) {
    auto array = nlohmann::ordered_json::array();
    for (const auto& row : rows) {
        auto object = nlohmann::ordered_json::object();
        const auto columns = std::min(headers.size(), row.size());
        for (size_t c = 0; c < columns; ++c) {
            object[headers[c]] = row[c];
        }
        array.push_back(std::move(object));
    }
    return DumpJson(array);
}

// Header row bold and ruled off, the node column highlighted.
std::string FtxuiTable(const Row& headers, const std::vector<Row>& rows) {
    std::vector<Row> cells;
    cells.reserve(rows.size() + 1);
    cells.push_back(headers);
    cells.insert(cells.end(), rows.begin(), rows.end());

    ftxui::Table table(cells);
    auto header = table.SelectRow(0);
    header.Decorate(ftxui::bold);
    header.SeparatorVertical(ftxui::LIGHT);
    header.BorderBottom(ftxui::LIGHT);
    if (!rows.empty()) {
        table.SelectRectangle(0, 0, 1, static_cast<int>(rows.size()))
            .DecorateCells(ftxui::color(ftxui::Color::Cyan));
    }

    auto document = table.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    return screen.ToString();
}

// Columns two spaces apart, a dashed rule under the header, no trailing
// padding on the last column.
std::string PlainTable(const Row& headers, const std::vector<Row>& rows) {
    std::vector<size_t> width;
    width.reserve(headers.size());
    for (const auto& h : headers) {
        width.push_back(h.size());
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < std::min(width.size(), row.size()); ++c) {
            width[c] = std::max(width[c], row[c].size());
        }
    }

    std::string text;
    auto emit = [&](const Row& row) {
        const auto columns = std::min(width.size(), row.size());
        for (size_t c = 0; c < columns; ++c) {
            if (c > 0) text += "  ";
            text += row[c];
            if (c + 1 < width.size()) {
                text.append(width[c] - row[c].size(), ' ');
            }
        }
        text += '\n';
    };

    emit(headers);
    Row rule;
    for (auto w : width) {
        rule.emplace_back(w, '-');
    }
    emit(rule);
    for (const auto& row : rows) {
        emit(row);
    }
    return text;
}

} // anonymous namespace

void OutputFormatter::PrintTable(const std::vector<std::string>& headers,
                                 const std::vector<std::vector<std::string>>& rows) const {
    if (json_mode_) {
        out_ << JsonTable(headers, rows) << "\n";
    } else if (color_mode_) {
        out_ << FtxuiTable(headers, rows) << "\n";
    } else {
        out_ << PlainTable(headers, rows);
    }
}

void OutputFormatter::PrintDocument(const std::string& text) const {
    out_ << text;
    if (text.empty() || text.back() != '\n') {
        out_ << "\n";
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    auto paint = [this](const char* code) { return color_mode_ ? code : ""; };
    auto detail = [&](const char* label, const std::string& value) {
        err_ << "  " << paint(ansi::kDim) << label << ": " << paint(ansi::kReset)
             << value << "\n";
    };

    err_ << paint(ansi::kRed) << "Error: " << paint(ansi::kReset)
         << paint(ansi::kBold) << Headline(error) << paint(ansi::kReset)
         << paint(ansi::kDim) << " (" << error.operation << ")" << paint(ansi::kReset)
         << "\n";
    err_ << "  " << error.message << "\n";
    if (!error.path.empty()) {
        detail("at", error.path);
    }
    if (error.expression.has_value()) {
        detail("expression", *error.expression);
    }
    if (!error.cycle.empty()) {
        detail("cycle", error.CycleString());
    }
    if (error.depth.has_value()) {
        detail("depth", std::to_string(*error.depth));
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << DumpJson({{"success", true}, {"message", message}}) << "\n";
    } else if (color_mode_) {
        out_ << ansi::kGreen << "OK" << ansi::kReset << " " << message << "\n";
    } else {
        out_ << message << "\n";
    }
}

} // namespace cfgref
