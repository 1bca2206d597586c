#include <mcp_probe/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_probe {

namespace {

// Raw lines can be arbitrarily long; keep diagnostics on one screen.
constexpr std::size_t kMaxRawInMessage = 512;

std::string Clip(const std::string& s) {
    if (s.size() <= kMaxRawInMessage) return s;
    return s.substr(0, kMaxRawInMessage) + "...";
}

} // anonymous namespace

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string message) {
    Error e;
    e.operation = std::move(operation);
    e.message = std::move(message);
    e.category = category;
    return e;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Launch:      return "launch";
        case ErrorCategory::Protocol:    return "protocol";
        case ErrorCategory::EndOfStream: return "end_of_stream";
        case ErrorCategory::Timeout:     return "timeout";
        case ErrorCategory::Assertion:   return "assertion";
        case ErrorCategory::Io:          return "io";
        case ErrorCategory::Config:      return "config";
        case ErrorCategory::Internal:    return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!method.empty()) {
        oss << " [" << method << "]";
    }
    oss << " (" << CategoryName() << "): " << message;
    if (raw_response.has_value()) {
        oss << " | raw: " << Clip(*raw_response);
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!method.empty()) {
        j["method"] = method;
    }
    if (raw_response.has_value()) {
        j["raw_response"] = *raw_response;
    }
    return nlohmann::json{{"error", j}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_probe
