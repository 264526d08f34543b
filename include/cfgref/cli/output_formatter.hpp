#pragma once

#include <cfgref/core/result.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace cfgref {

// Everything the resolve, check and graph commands print goes through here.
// Results go to `out`, errors to `err`. JSON mode turns color off; color
// mode draws tables with FTXUI and tints messages with ANSI codes.
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Human mode: aligned columns (FTXUI table in color mode).
    // JSON mode: an array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Write text to stdout as-is, adding a trailing newline if missing.
    void PrintDocument(const std::string& text) const;

    void PrintJson(const std::string& json) const;

    // JSON mode: Error::ToJson(). Otherwise a headline, the message, and
    // one line each for path, expression, cycle and depth when set.
    void PrintError(const Error& error) const;

    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace cfgref
