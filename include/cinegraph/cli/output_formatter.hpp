#pragma once

#include <cinegraph/core/result.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// DetailSection - a titled group of key/value lines for PrintDetail.
// An empty title puts the entries at the root of the tree.
// ---------------------------------------------------------------------------
struct DetailSection {
    std::string title;
    std::vector<std::pair<std::string, std::string>> entries;
};

// ---------------------------------------------------------------------------
// OutputFormatter - handles human-readable and JSON output for CLI commands.
//
// When color_mode is true and json_mode is false, uses FTXUI tables and
// ANSI escape codes for richer terminal output.
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

    // Table with headers and rows. In JSON mode, a JSON array of objects
    // keyed by header. In color mode, an FTXUI table.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Tree of key/value lines under a title (human-readable modes only).
    void PrintDetail(const std::string& title,
                     const std::vector<DetailSection>& sections) const;

    // Print a raw JSON string to stdout.
    void PrintJson(const std::string& json) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

    // Print a success message to stdout (human mode) or JSON (json mode).
    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace cinegraph
