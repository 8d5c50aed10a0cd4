#include <cinegraph/cli/output_formatter.hpp>
#include <cinegraph/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace cinegraph {

namespace {

using namespace cinegraph::ansi;

// Hint printed under an error, by category.
const char* HintFor(const Error& error) {
    switch (error.category) {
        case ErrorCategory::StoreUnavailable:
            return "Check --uri, --user and the password, or run with --offline <dataset.yaml>";
        case ErrorCategory::Timeout:
            return "Raise --timeout or the store's pool_size";
        default:
            return nullptr;
    }
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.reserve(rows.size() + 1);
        table_data.push_back(headers);
        table_data.insert(table_data.end(), rows.begin(), rows.end());

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

    // Plain table: pad every column to its widest cell.
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
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
        }
        out_ << "\n";
    };

    print_row(headers);
    std::vector<std::string> rule;
    for (auto w : widths) {
        rule.emplace_back(w, '-');
    }
    print_row(rule);
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    // Index of the last non-empty section; it closes the tree.
    size_t last = sections.size();
    for (size_t i = 0; i < sections.size(); ++i) {
        if (!sections[i].entries.empty()) last = i;
    }

    const char* branch = color_mode_ ? "├── " : "|-- ";
    const char* corner = color_mode_ ? "└── " : "+-- ";
    const char* dim = color_mode_ ? kDim : "";
    const char* bold = color_mode_ ? kBold : "";
    const char* reset = color_mode_ ? kReset : "";

    out_ << bold << title << reset << "\n";
    for (size_t si = 0; si < sections.size(); ++si) {
        const auto& sec = sections[si];
        if (sec.entries.empty()) continue;

        if (sec.title.empty()) {
            for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
                bool closes = si == last && ei + 1 == sec.entries.size();
                out_ << dim << (closes ? corner : branch) << reset
                     << sec.entries[ei].first << ": " << sec.entries[ei].second << "\n";
            }
            continue;
        }

        out_ << dim << (si == last ? corner : branch) << reset
             << bold << sec.title << reset << "\n";
        for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
            bool closes = ei + 1 == sec.entries.size();
            out_ << dim << "    " << (closes ? corner : branch) << reset
                 << sec.entries[ei].first;
            if (!sec.entries[ei].second.empty()) {
                out_ << ": " << sec.entries[ei].second;
            }
            out_ << "\n";
        }
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

    const char* red = color_mode_ ? kRed : "";
    const char* bold = color_mode_ ? kBold : "";
    const char* dim = color_mode_ ? kDim : "";
    const char* yellow = color_mode_ ? kYellow : "";
    const char* reset = color_mode_ ? kReset : "";

    err_ << red << "Error: " << reset << bold << error.operation << reset;
    if (!error.endpoint.empty()) {
        err_ << dim << " [" << error.endpoint << "]" << reset;
    }
    if (error.http_status.has_value()) {
        err_ << dim << " (HTTP " << *error.http_status << ")" << reset;
    }
    err_ << "\n  " << error.message << "\n";
    if (error.store_error.has_value() && !error.store_error->empty()) {
        err_ << "  " << dim << "Store: " << reset << *error.store_error << "\n";
    }
    if (const char* hint = HintFor(error)) {
        err_ << "  " << yellow << "Hint: " << reset << hint << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json doc = {{"success", true}, {"message", message}};
        out_ << doc.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace cinegraph
