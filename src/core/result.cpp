#include <xrdinfo/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace xrdinfo {

namespace {

// Extract text content of the first element whose local name is tag_name,
// with or without a namespace prefix (<faultstring>, <SOAP-ENV:faultstring>).
// No tinyxml2 here: core/ does not link the XML libraries.
std::optional<std::string> ExtractXmlText(const std::string& body,
                                          const std::string& tag_name) {
    size_t search_from = 0;
    while (true) {
        auto tag_pos = body.find(tag_name, search_from);
        if (tag_pos == std::string::npos || tag_pos == 0) return std::nullopt;
        search_from = tag_pos + tag_name.size();

        // Walk back over an optional "prefix:" to the opening '<'.
        size_t open = tag_pos;
        if (body[open - 1] == ':') {
            --open;
            while (open > 0 && body[open - 1] != '<' && body[open - 1] != '/' &&
                   body[open - 1] != ' ' && body[open - 1] != '>') {
                --open;
            }
        }
        if (open == 0 || body[open - 1] != '<') continue;

        const size_t after = tag_pos + tag_name.size();
        if (after >= body.size()) return std::nullopt;
        const char next = body[after];
        if (next != '>' && next != ' ' && next != '\t' && next != '\n' &&
            next != '\r' && next != '/') {
            continue;
        }

        auto content_start = body.find('>', after);
        if (content_start == std::string::npos) return std::nullopt;
        if (body[content_start - 1] == '/') return std::nullopt;
        ++content_start;

        auto content_end = body.find("</", content_start);
        if (content_end == std::string::npos) return std::nullopt;
        auto text = body.substr(content_start, content_end - content_start);
        if (text.empty()) return std::nullopt;
        return text;
    }
}

// REST gateways answer errors with {"type": ..., "message": ...}.
std::optional<std::string> ExtractJsonMessage(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    auto it = parsed.find("message");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::string> ExtractRemoteDetail(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto msg = ExtractXmlText(body, "faultstring");
    if (msg.has_value()) return msg;

    msg = ExtractJsonMessage(body);
    if (msg.has_value()) return msg;

    return body;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto remote = ExtractRemoteDetail(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::ProtocolFault;
            message = "Bad request";
            break;
        case 401:
        case 403:
            category = ErrorCategory::ProtocolFault;
            message = "Access denied by remote server";
            break;
        case 404:
            category = ErrorCategory::ProtocolFault;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 500:
            category = ErrorCategory::ProtocolFault;
            message = "Remote server error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Remote server unavailable";
            break;
        default:
            category = ErrorCategory::ProtocolFault;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    Error error{operation, endpoint, status_code, message, remote, category};
    if (category == ErrorCategory::ProtocolFault) {
        error.fault_code = "HTTP " + std::to_string(status_code);
    }
    return error;
}

Error Error::Fault(const std::string& operation,
                   const std::string& endpoint,
                   std::optional<int> http_status,
                   const std::string& fault_code,
                   const std::string& fault_string) {
    return Error{operation,
                 endpoint,
                 http_status,
                 "Remote fault " + fault_code,
                 fault_string,
                 ErrorCategory::ProtocolFault,
                 fault_code};
}

std::optional<ProtocolFault> Error::AsProtocolFault() const {
    if (category != ErrorCategory::ProtocolFault) {
        return std::nullopt;
    }
    return ProtocolFault{fault_code.value_or(""), remote_error.value_or("")};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (remote_error.has_value() && !remote_error->empty()) {
        oss << ": " << *remote_error;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json inner;
    inner["category"] = CategoryName();
    inner["operation"] = operation;
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    inner["message"] = message;
    if (remote_error.has_value()) {
        inner["remote_error"] = *remote_error;
    }
    if (fault_code.has_value()) {
        inner["fault_code"] = *fault_code;
    }
    inner["exit_code"] = ExitCode();
    nlohmann::json outer;
    outer["error"] = std::move(inner);
    return outer.dump();
}

} // namespace xrdinfo
