#include <mcp_probe/cli/report_printer.hpp>

#include <mcp_probe/core/ansi.hpp>

#include <iomanip>
#include <sstream>

namespace mcp_probe {

namespace {

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const char* OutcomeTag(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "[OK]     ";
        case StepOutcome::Skipped:   return "[SKIPPED]";
        case StepOutcome::Failed:    return "[FAILED] ";
    }
    return "[FAILED] ";
}

const char* OutcomeColor(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return ansi::kGreen;
        case StepOutcome::Skipped:   return ansi::kDim;
        case StepOutcome::Failed:    return ansi::kRed;
    }
    return "";
}

const char* PolicyName(StepPolicy policy) {
    switch (policy) {
        case StepPolicy::AbortOnFailure:    return "abort";
        case StepPolicy::ContinueOnFailure: return "continue";
    }
    return "abort";
}

} // anonymous namespace

nlohmann::json ScenarioToJson(const ScenarioResult& result) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& s : result.steps) {
        nlohmann::json step = {
            {"number", s.number},
            {"name", s.name},
            {"method", s.method},
            {"policy", PolicyName(s.policy)},
            {"outcome", StepOutcomeName(s.outcome)},
            {"message", s.message},
            {"duration_ms", s.duration.count()},
        };
        if (s.preview.has_value()) {
            step["preview"] = *s.preview;
        }
        if (s.error.has_value()) {
            step["error"] = {
                {"category", s.error->CategoryName()},
                {"message", s.error->message},
            };
            if (s.error->raw_response.has_value()) {
                step["error"]["raw_response"] = *s.error->raw_response;
            }
        }
        steps.push_back(std::move(step));
    }

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& t : result.tools) {
        tools.push_back({{"name", t.name}, {"description", t.description}});
    }

    return {
        {"success", result.success},
        {"aborted", result.aborted},
        {"exit_code", result.ExitCode()},
        {"summary", result.summary},
        {"total_duration_ms", result.total_duration.count()},
        {"steps", steps},
        {"tools", tools},
    };
}

nlohmann::json ExtractionToJson(const ExtractionResult& result) {
    nlohmann::json j = {{"kind", ContentKindName(result.kind)}};
    if (result.character_count.has_value()) {
        j["character_count"] = *result.character_count;
    }
    if (result.preview.has_value()) {
        j["preview"] = *result.preview;
    }
    if (result.type_name.has_value()) {
        j["type_name"] = *result.type_name;
    }
    return j;
}

void ReportPrinter::PrintScenario(const ScenarioResult& result, bool quiet) const {
    if (json_mode_) {
        out_ << Dump(ScenarioToJson(result)) << "\n";
        return;
    }

    if (!quiet) {
        for (const auto& s : result.steps) {
            if (color_mode_) {
                out_ << OutcomeColor(s.outcome) << OutcomeTag(s.outcome)
                     << ansi::kReset;
            } else {
                out_ << OutcomeTag(s.outcome);
            }
            // Formatted locally so the caller's stream flags stay untouched.
            std::ostringstream line;
            line << ' ' << s.number << ' ' << std::left << std::setw(28)
                 << s.name << ' ' << s.message;
            if (s.outcome != StepOutcome::Skipped) {
                line << " (" << s.duration.count() << "ms)";
            }
            out_ << line.str() << "\n";
        }
        out_ << "\n";

        if (!result.tools.empty()) {
            out_ << "Tools (" << result.tools.size() << "):\n";
            for (const auto& t : result.tools) {
                out_ << "  - " << t.name;
                if (!t.description.empty()) {
                    out_ << ": " << t.description;
                }
                out_ << "\n";
            }
            out_ << "\n";
        }
    }

    const char* verdict = result.success ? "PASS" : "FAIL";
    if (color_mode_) {
        out_ << (result.success ? ansi::kGreen : ansi::kRed) << verdict
             << ansi::kReset;
    } else {
        out_ << verdict;
    }
    out_ << ": " << result.summary << " in " << result.total_duration.count()
         << "ms\n";
}

void ReportPrinter::PrintExtraction(const ExtractionResult& result) const {
    if (json_mode_) {
        out_ << Dump(ExtractionToJson(result)) << "\n";
        return;
    }
    out_ << FormatReport(result) << "\n";
}

void ReportPrinter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }
    if (color_mode_) {
        err_ << ansi::kRed << "Error: " << ansi::kReset << error.ToString() << "\n";
    } else {
        err_ << "Error: " << error.ToString() << "\n";
    }
}

} // namespace mcp_probe
