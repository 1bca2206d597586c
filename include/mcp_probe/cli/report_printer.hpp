#pragma once

#include <mcp_probe/content/content_normalizer.hpp>
#include <mcp_probe/core/result.hpp>
#include <mcp_probe/scenario/conformance_scenario.hpp>

#include <iostream>

#include <nlohmann/json.hpp>

namespace mcp_probe {

// ---------------------------------------------------------------------------
// ReportPrinter - human-readable and JSON output for both subcommands.
//
// Reports go to `out`, errors to `err`. Color applies to human mode only.
// ---------------------------------------------------------------------------
class ReportPrinter {
public:
    explicit ReportPrinter(bool json_mode, bool color_mode = false,
                           std::ostream& out = std::cout,
                           std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }

    // One line per step plus the summary; `quiet` keeps only the summary.
    void PrintScenario(const ScenarioResult& result, bool quiet = false) const;

    void PrintExtraction(const ExtractionResult& result) const;

    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

nlohmann::json ScenarioToJson(const ScenarioResult& result);
nlohmann::json ExtractionToJson(const ExtractionResult& result);

} // namespace mcp_probe
