#pragma once

#include <xrdinfo/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// OutputFormatter — line-oriented or JSON output for CLI commands.
//
// Each command hands over both renderings of its result; the formatter
// writes the one matching the output mode. Errors go to the error stream.
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

    // One line per record in text mode; the JSON value in JSON mode.
    void PrintRecords(const std::vector<std::string>& lines,
                      const nlohmann::json& json) const;

    // A document (WSDL, OpenAPI) verbatim in text mode; in JSON mode wrapped
    // as {"content": ...}.
    void PrintDocument(const std::string& content) const;

    void PrintJson(const nlohmann::json& json) const;

    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace xrdinfo
