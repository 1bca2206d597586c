#include <catch2/catch_test_macros.hpp>

#include <mcp_probe/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace mcp_probe;

namespace {

std::string TestDataPath(const std::string& filename) {
    return std::string(MCP_PROBE_TESTDATA_DIR) + "/" + filename;
}

Result<AppConfig, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "mcp-probe");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.path == "/usr/local/bin/conversation-server");
    CHECK(config.server.response_timeout_ms == 10000);
    CHECK(config.server.shutdown_timeout_ms == 2000);
    CHECK(config.server.stderr_capture_bytes == 4096);

    CHECK(config.scenario.query == "c++ coroutines");
    CHECK(config.scenario.search_limit == 5);
    CHECK(config.scenario.topics_limit == 8);
    CHECK(config.scenario.client_name == "probe-ci");
    CHECK(config.scenario.client_version == "2.0.0");
    CHECK(config.scenario.initialized_notification);
    CHECK(config.scenario.strict);

    CHECK(config.log_file == std::optional<std::string>("/tmp/mcp-probe.log"));
    CHECK(config.json_output);
    CHECK(config.verbose);
    CHECK_FALSE(config.debug);
    CHECK(config.config_file.has_value());
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.path == "./build/conversation-server");
    CHECK(config.server.response_timeout_ms == 30000);
    CHECK(config.scenario.query == "rust");
    CHECK(config.scenario.search_limit == 3);
    CHECK(config.scenario.topics_limit == 5);
    CHECK_FALSE(config.scenario.strict);
    CHECK_FALSE(config.log_file.has_value());
}

TEST_CASE("LoadFromYaml: missing file is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: malformed YAML is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: wrong value types are a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_types_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("YAML") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseArgs({
        "--server", "./server",
        "--timeout-ms", "1500",
        "--shutdown-timeout-ms", "250",
        "--query", "zig",
        "--search-limit", "10",
        "--topics-limit", "2",
        "--protocol-version", "2025-03-26",
        "--initialized-notification",
        "--strict",
        "--json",
        "--log-file", "/tmp/probe.log",
        "--debug",
        "-q",
        "--no-color",
    });
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.path == "./server");
    CHECK(config.server.response_timeout_ms == 1500);
    CHECK(config.server.shutdown_timeout_ms == 250);
    CHECK(config.scenario.query == "zig");
    CHECK(config.scenario.search_limit == 10);
    CHECK(config.scenario.topics_limit == 2);
    CHECK(config.scenario.protocol_version == "2025-03-26");
    CHECK(config.scenario.initialized_notification);
    CHECK(config.scenario.strict);
    CHECK(config.json_output);
    CHECK(config.log_file == std::optional<std::string>("/tmp/probe.log"));
    CHECK(config.debug);
    CHECK(config.quiet);
    CHECK(config.force_no_color);
    CHECK_FALSE(config.force_color);
}

TEST_CASE("LoadFromCli: short flags", "[config][cli]") {
    auto result = ParseArgs({"-s", "./server", "-c", "probe.yaml", "-v"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.path == "./server");
    CHECK(result.Value().config_file == std::optional<std::string>("probe.yaml"));
    CHECK(result.Value().verbose);
}

TEST_CASE("LoadFromCli: no flags gives defaults", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.path.empty());
    CHECK(result.Value().server.response_timeout_ms == 30000);
    CHECK_FALSE(result.Value().scenario.strict);
}

TEST_CASE("LoadFromCli: unknown flag is a config error", "[config][cli]") {
    auto result = ParseArgs({"--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: non-numeric timeout is a config error", "[config][cli]") {
    auto result = ParseArgs({"--timeout-ms", "soon"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI values override YAML", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = ParseArgs({"--server", "./other", "--query", "go", "--timeout-ms", "100"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.server.path == "./other");
    CHECK(merged.server.response_timeout_ms == 100);
    CHECK(merged.scenario.query == "go");
    // Untouched YAML values survive.
    CHECK(merged.server.shutdown_timeout_ms == 2000);
    CHECK(merged.scenario.search_limit == 5);
    CHECK(merged.scenario.strict);
    CHECK(merged.json_output);
}

TEST_CASE("MergeConfigs: boolean flags only switch on", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = ParseArgs({"--strict", "--json"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.scenario.strict);
    CHECK(merged.json_output);
    CHECK(merged.server.path == "./build/conversation-server");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: server path is required", "[config][validate]") {
    AppConfig config;
    auto r = ValidateConfig(config);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
    CHECK(r.Error().message.find("server path") != std::string::npos);
}

TEST_CASE("ValidateConfig: accepts defaults with a path", "[config][validate]") {
    AppConfig config;
    config.server.path = "./server";
    CHECK(ValidateConfig(config).IsOk());

    config.server.response_timeout_ms = 0;  // unbounded
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: rejects out-of-range values", "[config][validate]") {
    AppConfig base;
    base.server.path = "./server";

    auto config = base;
    config.server.response_timeout_ms = -1;
    CHECK(ValidateConfig(config).IsErr());

    config = base;
    config.scenario.search_limit = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = base;
    config.scenario.topics_limit = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = base;
    config.scenario.protocol_version.clear();
    CHECK(ValidateConfig(config).IsErr());

    config = base;
    config.force_color = true;
    config.force_no_color = true;
    CHECK(ValidateConfig(config).IsErr());
}
