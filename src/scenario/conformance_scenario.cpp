#include <mcp_probe/scenario/conformance_scenario.hpp>

#include <mcp_probe/content/content_normalizer.hpp>
#include <mcp_probe/core/log.hpp>

#include <sstream>
#include <utility>

namespace mcp_probe {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kComponent = "scenario";

constexpr const char* kSearchTool = "search_conversations";
constexpr const char* kStatsTool = "get_conversation_stats";
constexpr const char* kTopicsTool = "analyze_conversation_topics";

constexpr std::size_t kSearchPreviewChars = 200;
constexpr std::size_t kToolPreviewChars = 300;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

Error AssertionError(const std::string& method, const std::string& message,
                     const std::string& raw) {
    auto e = Error::Make(ErrorCategory::Assertion, "ConformanceScenario",
                         message);
    e.method = method;
    e.raw_response = raw;
    return e;
}

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// result.content[0].text, if the response carries it.
std::optional<std::string> FirstContentText(const nlohmann::json& result) {
    if (!result.is_object()) return std::nullopt;
    auto content = result.find("content");
    if (content == result.end() || !content->is_array() || content->empty()) {
        return std::nullopt;
    }
    const auto& first = (*content)[0];
    if (!first.is_object()) return std::nullopt;
    auto text = first.find("text");
    if (text == first.end() || !text->is_string()) return std::nullopt;
    return text->get<std::string>();
}

// Optional string field of a server-supplied object; wrong types read as absent.
std::optional<std::string> StringField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

bool IsErrorFlagSet(const nlohmann::json& result) {
    if (!result.is_object()) return false;
    auto it = result.find("isError");
    return it != result.end() && it->is_boolean() && it->get<bool>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseToolList
// ---------------------------------------------------------------------------
Result<std::vector<ToolDescriptor>, Error> ParseToolList(const nlohmann::json& result) {
    using R = Result<std::vector<ToolDescriptor>, Error>;
    const std::string raw = Dump(result);

    if (!result.is_object() || !result.contains("tools")) {
        return R::Err(AssertionError("tools/list", "result.tools is missing", raw));
    }
    const auto& tools = result["tools"];
    if (!tools.is_array()) {
        return R::Err(AssertionError("tools/list", "result.tools is not an array", raw));
    }
    if (tools.empty()) {
        return R::Err(AssertionError("tools/list", "result.tools is empty", raw));
    }

    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(tools.size());
    for (std::size_t i = 0; i < tools.size(); ++i) {
        const auto& entry = tools[i];
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return R::Err(AssertionError("tools/list",
                "tool #" + std::to_string(i) + " has no string 'name'", raw));
        }
        ToolDescriptor tool;
        tool.name = entry["name"].get<std::string>();
        if (entry.contains("description") && entry["description"].is_string()) {
            tool.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema")) {
            tool.input_schema = entry["inputSchema"];
        }
        descriptors.push_back(std::move(tool));
    }
    return R::Ok(std::move(descriptors));
}

// ---------------------------------------------------------------------------
// ScenarioResult
// ---------------------------------------------------------------------------
std::size_t ScenarioResult::CountOutcome(StepOutcome outcome) const {
    std::size_t n = 0;
    for (const auto& s : steps) {
        if (s.outcome == outcome) ++n;
    }
    return n;
}

const char* StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "failed";
}

// ---------------------------------------------------------------------------
// ConformanceScenario
// ---------------------------------------------------------------------------
ConformanceScenario::ConformanceScenario(RpcClient& client,
                                         const ScenarioConfig& config)
    : client_(client), config_(config) {}

std::vector<ConformanceScenario::StepSpec> ConformanceScenario::BuildSteps() const {
    const nlohmann::json initialize_params = {
        {"protocolVersion", config_.protocol_version},
        {"capabilities", {
            {"experimental", nlohmann::json::object()},
            {"sampling", nlohmann::json::object()},
        }},
        {"clientInfo", {
            {"name", config_.client_name},
            {"version", config_.client_version},
        }},
    };

    const bool notify = config_.initialized_notification;

    return {
        {1, "initialize", "initialize", initialize_params,
         StepPolicy::AbortOnFailure, 0, false},
        {2, "initialized", notify ? "notifications/initialized" : "initialized",
         std::nullopt, StepPolicy::AbortOnFailure, 0, notify},
        {3, "list tools", "tools/list", std::nullopt,
         StepPolicy::AbortOnFailure, 0, false},
        {4, kSearchTool, "tools/call",
         nlohmann::json{{"name", kSearchTool},
                        {"arguments", {{"query", config_.query},
                                       {"limit", config_.search_limit}}}},
         StepPolicy::ContinueOnFailure, kSearchPreviewChars, false},
        {5, kStatsTool, "tools/call",
         nlohmann::json{{"name", kStatsTool},
                        {"arguments", nlohmann::json::object()}},
         StepPolicy::ContinueOnFailure, kToolPreviewChars, false},
        {6, kTopicsTool, "tools/call",
         nlohmann::json{{"name", kTopicsTool},
                        {"arguments", {{"limit", config_.topics_limit}}}},
         StepPolicy::ContinueOnFailure, kToolPreviewChars, false},
    };
}

ConformanceScenario::Predicate ConformanceScenario::PredicateFor(
    const StepSpec& spec, ScenarioResult& result) const {
    if (spec.method == "initialize") {
        return [this](const JsonRpcResponse& r, StepResult&) {
            const auto& res = *r.result;
            std::string message = "initialize acknowledged";
            if (res.is_object() && res.contains("serverInfo") &&
                res["serverInfo"].is_object()) {
                const auto& info = res["serverInfo"];
                message = "server " + StringField(info, "name").value_or("?") +
                          " " + StringField(info, "version").value_or("?");
            }
            if (res.is_object() && res.contains("protocolVersion") &&
                res["protocolVersion"] != config_.protocol_version) {
                LogWarn(kComponent, "server negotiated protocolVersion " +
                        Dump(res["protocolVersion"]) + ", requested " +
                        config_.protocol_version);
            }
            return Result<std::string, Error>::Ok(message);
        };
    }

    if (spec.method == "tools/list") {
        return [&result](const JsonRpcResponse& r, StepResult&) {
            auto tools = ParseToolList(*r.result);
            if (tools.IsErr()) {
                return Result<std::string, Error>::Err(tools.Error());
            }
            result.tools = std::move(tools).Value();
            LogInfo(kComponent, "found " + std::to_string(result.tools.size()) + " tools:");
            for (const auto& tool : result.tools) {
                LogInfo(kComponent, "  - " + tool.name + ": " + tool.description);
            }
            return Result<std::string, Error>::Ok(
                std::to_string(result.tools.size()) + " tools");
        };
    }

    if (spec.method == "tools/call") {
        const auto preview_chars = spec.preview_chars;
        return [preview_chars](const JsonRpcResponse& r, StepResult& step) {
            auto text = FirstContentText(*r.result);
            if (!text.has_value()) {
                return Result<std::string, Error>::Err(AssertionError(
                    step.method, "result.content[0].text is missing", r.raw));
            }
            if (IsErrorFlagSet(*r.result)) {
                LogWarn(kComponent, step.name + " returned isError=true");
            }
            step.preview = Utf8Prefix(*text, preview_chars) + kPreviewMarker;
            LogInfo(kComponent, step.name + " preview:\n" + *step.preview);
            return Result<std::string, Error>::Ok(
                std::to_string(Utf8Length(*text)) + " chars of text");
        };
    }

    // initialized: any result is acceptable.
    return [](const JsonRpcResponse&, StepResult&) {
        return Result<std::string, Error>::Ok(std::string("initialized acknowledged"));
    };
}

StepResult ConformanceScenario::RunStep(const StepSpec& spec,
                                        const Predicate& predicate) {
    const auto start = Clock::now();

    StepResult step;
    step.number = spec.number;
    step.name = spec.name;
    step.method = spec.method;
    step.policy = spec.policy;

    std::string request_line = "(not sent)";
    auto fail = [&](Error error) {
        if (error.method.empty()) {
            error.method = spec.method;
        }
        LogError(kComponent, "step " + std::to_string(spec.number) + " (" +
                 spec.name + ") failed: " + error.ToString() +
                 (error.raw_response.has_value() ? "" : " | no response") +
                 " | request: " + request_line);
        step.outcome = StepOutcome::Failed;
        step.message = error.message;
        step.error = std::move(error);
        step.duration = Elapsed(start);
        return step;
    };

    LogInfo(kComponent, "step " + std::to_string(spec.number) + ": " + spec.name);

    const nlohmann::json request_id = spec.number;
    auto sent = client_.SendRequest(spec.method, spec.params, request_id);
    if (sent.IsErr()) {
        return fail(std::move(sent).Error());
    }
    request_line = Dump(sent.Value());

    auto response = client_.RecvResponse();
    if (response.IsErr()) {
        return fail(std::move(response).Error());
    }
    const auto& r = response.Value();

    if (!r.IdMatches(request_id)) {
        const std::string message = "response id " + Dump(r.id) +
                                    " does not match request id " +
                                    Dump(request_id);
        if (config_.strict) {
            return fail(AssertionError(spec.method, message, r.raw));
        }
        LogWarn(kComponent, message);
    }

    if (r.IsError()) {
        return fail(AssertionError(spec.method,
            "server returned error: " + Dump(*r.error), r.raw));
    }

    std::string message;
    try {
        auto verdict = predicate(r, step);
        if (verdict.IsErr()) {
            return fail(std::move(verdict).Error());
        }
        message = std::move(verdict).Value();
    } catch (const nlohmann::json::exception& e) {
        return fail(AssertionError(spec.method,
            std::string("unexpected result shape: ") + e.what(), r.raw));
    }

    step.outcome = StepOutcome::Completed;
    step.message = std::move(message);
    step.duration = Elapsed(start);
    return step;
}

StepResult ConformanceScenario::RunInitializedNotification(const StepSpec& spec) {
    const auto start = Clock::now();

    StepResult step;
    step.number = spec.number;
    step.name = spec.name;
    step.method = spec.method;
    step.policy = spec.policy;

    auto sent = client_.SendNotification(spec.method, spec.params);
    if (sent.IsErr()) {
        auto error = std::move(sent).Error();
        LogError(kComponent, "step " + std::to_string(spec.number) + " (" +
                 spec.name + ") failed: " + error.ToString());
        step.outcome = StepOutcome::Failed;
        step.message = error.message;
        step.error = std::move(error);
    } else {
        step.outcome = StepOutcome::Completed;
        step.message = "notification sent, no reply expected";
    }
    step.duration = Elapsed(start);
    return step;
}

ScenarioResult ConformanceScenario::Run() {
    const auto total_start = Clock::now();
    ScenarioResult result;

    int aborted_at = 0;
    bool functional_failed = false;

    for (const auto& spec : BuildSteps()) {
        if (result.aborted) {
            StepResult skipped;
            skipped.number = spec.number;
            skipped.name = spec.name;
            skipped.method = spec.method;
            skipped.policy = spec.policy;
            skipped.outcome = StepOutcome::Skipped;
            skipped.message = "not sent: step " + std::to_string(aborted_at) + " failed";
            result.steps.push_back(std::move(skipped));
            continue;
        }

        StepResult step = spec.notification
            ? RunInitializedNotification(spec)
            : RunStep(spec, PredicateFor(spec, result));

        if (step.outcome == StepOutcome::Failed) {
            if (spec.policy == StepPolicy::AbortOnFailure) {
                result.aborted = true;
                aborted_at = spec.number;
                LogError(kComponent, "handshake failed at step " +
                         std::to_string(spec.number) + ", aborting");
            } else {
                functional_failed = true;
            }
        } else {
            LogInfo(kComponent, "step " + std::to_string(spec.number) + " ok: " +
                    step.message);
        }
        result.steps.push_back(std::move(step));
    }

    result.success = !result.aborted && !(config_.strict && functional_failed);
    result.total_duration = Elapsed(total_start);

    std::ostringstream oss;
    oss << result.CountOutcome(StepOutcome::Completed) << " completed, "
        << result.CountOutcome(StepOutcome::Failed) << " failed, "
        << result.CountOutcome(StepOutcome::Skipped) << " skipped";
    if (result.aborted) {
        oss << " (aborted at step " << aborted_at << ")";
    }
    result.summary = oss.str();

    return result;
}

} // namespace mcp_probe
