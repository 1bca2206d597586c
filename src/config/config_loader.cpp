#include <mcp_probe/config/config_loader.hpp>

#include <mcp_probe/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>
#include <string>

namespace mcp_probe {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

void ParseServerSection(const YAML::Node& node, ServerConfig& server) {
    ReadIfPresent(node, "path", server.path);
    ReadIfPresent(node, "response_timeout_ms", server.response_timeout_ms);
    ReadIfPresent(node, "shutdown_timeout_ms", server.shutdown_timeout_ms);
    ReadIfPresent(node, "stderr_capture_bytes", server.stderr_capture_bytes);
}

void ParseScenarioSection(const YAML::Node& node, ScenarioConfig& scenario) {
    ReadIfPresent(node, "query", scenario.query);
    ReadIfPresent(node, "search_limit", scenario.search_limit);
    ReadIfPresent(node, "topics_limit", scenario.topics_limit);
    ReadIfPresent(node, "protocol_version", scenario.protocol_version);
    ReadIfPresent(node, "client_name", scenario.client_name);
    ReadIfPresent(node, "client_version", scenario.client_version);
    ReadIfPresent(node, "initialized_notification", scenario.initialized_notification);
    ReadIfPresent(node, "strict", scenario.strict);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["server"]) {
            ParseServerSection(root["server"], config.server);
        }
        if (root["scenario"]) {
            ParseScenarioSection(root["scenario"], config.scenario);
        }

        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        ReadIfPresent(root, "json_output", config.json_output);
        ReadIfPresent(root, "verbose", config.verbose);
        ReadIfPresent(root, "debug", config.debug);
        ReadIfPresent(root, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-probe", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Drive an MCP stdio server through the handshake and tool calls.");

    // Server
    program.add_argument("-s", "--server")
        .help("Path to the MCP server executable");
    program.add_argument("--timeout-ms")
        .help("Per-response timeout in milliseconds (0 waits forever)")
        .scan<'i', int>();
    program.add_argument("--shutdown-timeout-ms")
        .help("Grace period after SIGTERM before SIGKILL")
        .scan<'i', int>();

    // Scenario
    program.add_argument("--query")
        .help("Query for search_conversations");
    program.add_argument("--search-limit")
        .help("Result limit for search_conversations")
        .scan<'i', int>();
    program.add_argument("--topics-limit")
        .help("Limit for analyze_conversation_topics")
        .scan<'i', int>();
    program.add_argument("--protocol-version")
        .help("protocolVersion sent in initialize");
    program.add_argument("--initialized-notification")
        .help("Send notifications/initialized without an id and do not wait")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--strict")
        .help("Fail the run when any tool call fails")
        .default_value(false)
        .implicit_value(true);

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Debug-level logging, including the wire transcript")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only print the summary line")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    AppConfig config;
    try {
        program.parse_args(argc, argv);

        if (auto val = program.present("--server")) {
            config.server.path = *val;
        }
        if (auto val = program.present<int>("--timeout-ms")) {
            config.server.response_timeout_ms = *val;
        }
        if (auto val = program.present<int>("--shutdown-timeout-ms")) {
            config.server.shutdown_timeout_ms = *val;
        }

        if (auto val = program.present("--query")) {
            config.scenario.query = *val;
        }
        if (auto val = program.present<int>("--search-limit")) {
            config.scenario.search_limit = *val;
        }
        if (auto val = program.present<int>("--topics-limit")) {
            config.scenario.topics_limit = *val;
        }
        if (auto val = program.present("--protocol-version")) {
            config.scenario.protocol_version = *val;
        }
        config.scenario.initialized_notification =
            program.get<bool>("--initialized-notification");
        config.scenario.strict = program.get<bool>("--strict");

        if (auto val = program.present("--config")) {
            config.config_file = *val;
        }
        if (auto val = program.present("--log-file")) {
            config.log_file = *val;
        }
        config.json_output = program.get<bool>("--json");
        config.verbose = program.get<bool>("--verbose");
        config.debug = program.get<bool>("--debug");
        config.quiet = program.get<bool>("--quiet");
        config.force_color = program.get<bool>("--color");
        config.force_no_color = program.get<bool>("--no-color");
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    const auto& cs = cli_overrides.server;
    if (!cs.path.empty()) {
        merged.server.path = cs.path;
    }
    if (cs.response_timeout_ms != defaults.server.response_timeout_ms) {
        merged.server.response_timeout_ms = cs.response_timeout_ms;
    }
    if (cs.shutdown_timeout_ms != defaults.server.shutdown_timeout_ms) {
        merged.server.shutdown_timeout_ms = cs.shutdown_timeout_ms;
    }
    if (cs.stderr_capture_bytes != defaults.server.stderr_capture_bytes) {
        merged.server.stderr_capture_bytes = cs.stderr_capture_bytes;
    }

    const auto& sc = cli_overrides.scenario;
    if (sc.query != defaults.scenario.query) {
        merged.scenario.query = sc.query;
    }
    if (sc.search_limit != defaults.scenario.search_limit) {
        merged.scenario.search_limit = sc.search_limit;
    }
    if (sc.topics_limit != defaults.scenario.topics_limit) {
        merged.scenario.topics_limit = sc.topics_limit;
    }
    if (sc.protocol_version != defaults.scenario.protocol_version) {
        merged.scenario.protocol_version = sc.protocol_version;
    }
    if (sc.client_name != defaults.scenario.client_name) {
        merged.scenario.client_name = sc.client_name;
    }
    if (sc.client_version != defaults.scenario.client_version) {
        merged.scenario.client_version = sc.client_version;
    }
    // Boolean flags can only switch a behavior on from the command line.
    if (sc.initialized_notification) {
        merged.scenario.initialized_notification = true;
    }
    if (sc.strict) {
        merged.scenario.strict = true;
    }

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    merged.json_output = yaml_base.json_output || cli_overrides.json_output;
    merged.verbose = yaml_base.verbose || cli_overrides.verbose;
    merged.debug = yaml_base.debug || cli_overrides.debug;
    merged.quiet = yaml_base.quiet || cli_overrides.quiet;
    merged.force_color = cli_overrides.force_color;
    merged.force_no_color = cli_overrides.force_no_color;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.path.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required field: server path (--server or server.path)"));
    }
    if (config.server.response_timeout_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("response timeout must be >= 0"));
    }
    if (config.server.shutdown_timeout_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("shutdown timeout must be >= 0"));
    }
    if (config.server.stderr_capture_bytes < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("stderr capture size must be >= 0"));
    }
    if (config.scenario.search_limit < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("search limit must be >= 1"));
    }
    if (config.scenario.topics_limit < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("topics limit must be >= 1"));
    }
    if (config.scenario.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("protocol version must not be empty"));
    }
    if (config.force_color && config.force_no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("--color and --no-color are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_probe
