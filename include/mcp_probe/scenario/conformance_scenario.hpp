#pragma once

#include <mcp_probe/config/app_config.hpp>
#include <mcp_probe/core/result.hpp>
#include <mcp_probe/rpc/rpc_client.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_probe {

// ---------------------------------------------------------------------------
// ToolDescriptor - one entry of the tools/list result.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

// Decode `result.tools`. Fails with ErrorCategory::Assertion when the list is
// missing, empty, or an entry has no string `name`.
[[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ParseToolList(
    const nlohmann::json& result);

// ---------------------------------------------------------------------------
// StepPolicy - what a failure does to the rest of the scenario.
// ---------------------------------------------------------------------------
enum class StepPolicy {
    AbortOnFailure,     // handshake and discovery
    ContinueOnFailure,  // independent tool calls
};

enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

// ---------------------------------------------------------------------------
// StepResult - outcome + timing for a single scenario step.
// ---------------------------------------------------------------------------
struct StepResult {
    int number = 0;
    std::string name;
    std::string method;
    StepPolicy policy = StepPolicy::AbortOnFailure;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::optional<std::string> preview;
    std::optional<Error> error;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// ScenarioResult - aggregated results from one run.
// ---------------------------------------------------------------------------
struct ScenarioResult {
    bool success = false;
    bool aborted = false;
    std::vector<StepResult> steps;
    std::vector<ToolDescriptor> tools;
    std::string summary;
    std::chrono::milliseconds total_duration{0};

    [[nodiscard]] int ExitCode() const { return success ? 0 : 1; }
    [[nodiscard]] std::size_t CountOutcome(StepOutcome outcome) const;
};

// ---------------------------------------------------------------------------
// ConformanceScenario - the fixed six-step MCP conversation.
//
//   1 initialize   2 initialized   3 tools/list      (abort on failure)
//   4 search_conversations  5 get_conversation_stats
//   6 analyze_conversation_topics                    (continue on failure)
//
// Request ids are the step numbers. Each request waits for its response
// before the next one is sent. After an aborting failure the remaining steps
// are recorded as Skipped and never sent.
//
// Takes ownership of nothing - the client must outlive this object.
// ---------------------------------------------------------------------------
class ConformanceScenario {
public:
    ConformanceScenario(RpcClient& client, const ScenarioConfig& config);

    ConformanceScenario(const ConformanceScenario&) = delete;
    ConformanceScenario& operator=(const ConformanceScenario&) = delete;

    [[nodiscard]] ScenarioResult Run();

private:
    struct StepSpec {
        int number;
        std::string name;
        std::string method;
        std::optional<nlohmann::json> params;
        StepPolicy policy;
        std::size_t preview_chars;
        bool notification;  // sent without an id, no reply awaited
    };

    // Check applied to a response envelope; returns the step message or an
    // Assertion error.
    using Predicate = std::function<Result<std::string, Error>(
        const JsonRpcResponse&, StepResult&)>;

    std::vector<StepSpec> BuildSteps() const;
    StepResult RunStep(const StepSpec& spec, const Predicate& predicate);
    StepResult RunInitializedNotification(const StepSpec& spec);
    Predicate PredicateFor(const StepSpec& spec, ScenarioResult& result) const;

    RpcClient& client_;
    const ScenarioConfig& config_;
};

const char* StepOutcomeName(StepOutcome outcome);

} // namespace mcp_probe
