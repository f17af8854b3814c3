#include <xrdinfo/cli/output_formatter.hpp>
#include <xrdinfo/core/ansi.hpp>

namespace xrdinfo {

using namespace xrdinfo::ansi;

void OutputFormatter::PrintRecords(const std::vector<std::string>& lines,
                                   const nlohmann::json& json) const {
    if (json_mode_) {
        PrintJson(json);
        return;
    }
    for (const auto& line : lines) {
        out_ << line << "\n";
    }
}

void OutputFormatter::PrintDocument(const std::string& content) const {
    if (json_mode_) {
        PrintJson(nlohmann::json{{"content", content}});
        return;
    }
    out_ << content;
    if (content.empty() || content.back() != '\n') {
        out_ << "\n";
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& json) const {
    out_ << json.dump(2) << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        err_ << kDim << " [" << error.CategoryName() << "]" << kReset;
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.remote_error.has_value() && !error.remote_error->empty()) {
            err_ << "  " << kDim << "Remote: " << kReset << error.remote_error.value() << "\n";
        }
        if (!error.endpoint.empty()) {
            err_ << "  " << kDim << "Endpoint: " << kReset << error.endpoint << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation << " [" << error.CategoryName() << "]";
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.remote_error.has_value() && !error.remote_error->empty()) {
        err_ << "  Remote: " << error.remote_error.value() << "\n";
    }
    if (!error.endpoint.empty()) {
        err_ << "  Endpoint: " << error.endpoint << "\n";
    }
}

} // namespace xrdinfo
