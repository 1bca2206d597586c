#pragma once

#include <iostream>
#include <vector>

namespace mcp_probe {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage   = 2;

enum class Subcommand {
    Run,        // conformance scenario (default)
    Normalize,  // content normalizer on one stdin record
};

struct SubcommandParse {
    Subcommand cmd;
    bool found_subcommand;
};

// First argument selects the subcommand; anything else means `run`.
SubcommandParse ParseSubcommand(int argc, const char* const* argv);

// argv without the subcommand token, so LoadFromCli sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand);

// ---------------------------------------------------------------------------
// CommandStreams - where a command reads its record and writes its output.
//
// Reports go to `out`, errors to `err`. Log lines always go to the process
// stderr. Color is only considered when `out` is std::cout.
// ---------------------------------------------------------------------------
struct CommandStreams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

// `mcp-probe normalize`: one JSON record from `in`, report on `out`.
// 0 on any JSON record, 1 on empty or non-JSON input, 2 on a bad flag.
int RunNormalizeCommand(int argc, const char* const* argv,
                        const CommandStreams& io);

// `mcp-probe [run]`: config, launch, scenario, teardown, report.
// 0 on success, 1 on launch or scenario failure, 2 on config errors.
int RunScenarioCommand(int argc, const char* const* argv, bool has_subcommand,
                       const CommandStreams& io);

// Full dispatch, including --version and help.
int RunCommand(int argc, const char* const* argv, const CommandStreams& io);

} // namespace mcp_probe
