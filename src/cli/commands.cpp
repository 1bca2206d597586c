#include <mcp_probe/cli/commands.hpp>

#include <mcp_probe/cli/report_printer.hpp>
#include <mcp_probe/config/config_loader.hpp>
#include <mcp_probe/content/content_normalizer.hpp>
#include <mcp_probe/core/log.hpp>
#include <mcp_probe/core/terminal.hpp>
#include <mcp_probe/core/version.hpp>
#include <mcp_probe/process/process_harness.hpp>
#include <mcp_probe/rpc/rpc_client.hpp>
#include <mcp_probe/scenario/conformance_scenario.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace mcp_probe {

namespace {

bool HasVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            return true;
        }
    }
    return false;
}

void PrintTopLevelHelp(std::ostream& out) {
    out << "mcp-probe " << kVersion << "\n"
        << "\n"
        << "Usage:\n"
        << "  mcp-probe [run] --server <path> [options]   drive an MCP stdio server\n"
        << "  mcp-probe normalize [--json]                classify one JSON record from stdin\n"
        << "\n"
        << "Run 'mcp-probe run --help' for scenario options.\n";
}

// Stdout color only makes sense when the report actually goes there.
bool ReportColor(const AppConfig& config, const CommandStreams& io) {
    const bool is_tty = &io.out == &std::cout && IsStdoutTty();
    return ResolveColor(config.force_color, config.force_no_color, is_tty);
}

void InitLogging(const AppConfig& config) {
    auto level = LogLevel::Warn;
    if (config.verbose) level = LogLevel::Info;
    if (config.debug) level = LogLevel::Debug;

    const bool use_color = ResolveColor(config.force_color,
                                        config.force_no_color, IsStderrTty());

    std::unique_ptr<FileSink> file_sink;
    if (config.log_file.has_value()) {
        file_sink = std::make_unique<FileSink>(*config.log_file);
    }
    const bool file_failed = file_sink && !file_sink->IsOpen();

    if (file_sink && !file_failed) {
        std::vector<std::unique_ptr<ILogSink>> sinks;
        sinks.push_back(std::make_unique<ColorConsoleSink>(use_color));
        sinks.push_back(std::move(file_sink));
        InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)), level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), level);
    }

    if (file_failed) {
        LogWarn("config", "cannot open log file " + *config.log_file);
    }
}

int RunScenario(const AppConfig& config, const ReportPrinter& printer) {
    ProcessOptions process_options;
    process_options.shutdown_timeout =
        std::chrono::milliseconds(config.server.shutdown_timeout_ms);
    process_options.stderr_capture_bytes =
        static_cast<std::size_t>(config.server.stderr_capture_bytes);

    auto started = ProcessHarness::Start(config.server.path, process_options);
    if (started.IsErr()) {
        LogError("harness", started.Error().ToString());
        printer.PrintError(started.Error());
        return started.Error().ExitCode();
    }
    auto process = std::move(started).Value();

    RpcClientOptions rpc_options;
    if (config.server.response_timeout_ms > 0) {
        rpc_options.response_timeout =
            std::chrono::milliseconds(config.server.response_timeout_ms);
    }
    RpcClient client(*process, rpc_options);

    ConformanceScenario scenario(client, config.scenario);
    const auto result = scenario.Run();

    // The server is gone before anything is reported.
    const auto termination = process->Terminate();
    if (termination.force_killed) {
        LogWarn("harness", "server had to be force-killed");
    }

    printer.PrintScenario(result, config.quiet);
    return result.ExitCode();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Subcommand parsing
// ---------------------------------------------------------------------------
SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {Subcommand::Run, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "run") {
        return {Subcommand::Run, true};
    }
    if (arg1 == "normalize") {
        return {Subcommand::Normalize, true};
    }
    return {Subcommand::Run, false};
}

std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (has_subcommand && i == 1) {
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

// ---------------------------------------------------------------------------
// normalize
// ---------------------------------------------------------------------------
int RunNormalizeCommand(int argc, const char* const* argv,
                        const CommandStreams& io) {
    AppConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "normalize") continue;
        if (arg == "--json") config.json_output = true;
        else if (arg == "-v" || arg == "--verbose") config.verbose = true;
        else if (arg == "--debug") config.debug = true;
        else if (arg == "--color") config.force_color = true;
        else if (arg == "--no-color") config.force_no_color = true;
        else if (arg == "-h" || arg == "--help") {
            io.out << "Usage: mcp-probe normalize [--json] [-v] [--debug]\n"
                   << "Reads one JSON record from stdin and reports its content shape.\n";
            return kExitSuccess;
        } else {
            ReportPrinter(false, false, io.out, io.err).PrintError(
                Error::Make(ErrorCategory::Config, "normalize",
                            "unknown argument: " + std::string(arg)));
            return kExitUsage;
        }
    }
    InitLogging(config);

    ReportPrinter printer(config.json_output, ReportColor(config, io),
                          io.out, io.err);

    if (&io.in == &std::cin && IsStdinTty()) {
        LogWarn("normalize", "reading one JSON record from stdin");
    }

    std::string line;
    if (!std::getline(io.in, line)) {
        printer.PrintError(Error::Make(ErrorCategory::EndOfStream, "normalize",
                                       "no input on stdin"));
        return kExitFailure;
    }

    nlohmann::json record;
    try {
        record = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        auto error = Error::Make(ErrorCategory::Protocol, "normalize",
                                 std::string("input is not valid JSON: ") + e.what());
        error.raw_response = line;
        printer.PrintError(error);
        return kExitFailure;
    }

    const auto result = Normalize(record);
    LogDebug("normalize", std::string("classified as ") + ContentKindName(result.kind));
    printer.PrintExtraction(result);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
int RunScenarioCommand(int argc, const char* const* argv, bool has_subcommand,
                       const CommandStreams& io) {
    auto stripped = StripSubcommand(argc, argv, has_subcommand);
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        ReportPrinter(false, false, io.out, io.err).PrintError(cli_result.Error());
        return kExitUsage;
    }
    auto config = std::move(cli_result).Value();

    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            ReportPrinter(config.json_output, false, io.out, io.err)
                .PrintError(yaml_result.Error());
            return kExitUsage;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    ReportPrinter printer(config.json_output, ReportColor(config, io),
                          io.out, io.err);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        printer.PrintError(valid.Error());
        return kExitUsage;
    }

    InitLogging(config);
    LogDebug("config", "server " + config.server.path + ", response timeout " +
             std::to_string(config.server.response_timeout_ms) + "ms");

    return RunScenario(config, printer);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
int RunCommand(int argc, const char* const* argv, const CommandStreams& io) {
    if (argc < 2) {
        PrintTopLevelHelp(io.out);
        return kExitUsage;
    }
    if (HasVersionFlag(argc, argv)) {
        io.out << "mcp-probe " << kVersion << "\n";
        return kExitSuccess;
    }

    auto [subcommand, has_subcommand] = ParseSubcommand(argc, argv);
    if (!has_subcommand && std::string_view{argv[1]} == "help") {
        PrintTopLevelHelp(io.out);
        return kExitSuccess;
    }

    switch (subcommand) {
        case Subcommand::Normalize:
            return RunNormalizeCommand(argc, argv, io);
        case Subcommand::Run:
            return RunScenarioCommand(argc, argv, has_subcommand, io);
    }
    return kExitFailure;
}

} // namespace mcp_probe
