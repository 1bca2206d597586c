#include <catch2/catch_test_macros.hpp>

#include <mcp_probe/cli/commands.hpp>
#include <mcp_probe/core/version.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace mcp_probe;

namespace {

constexpr const char* kFakeServer = MCP_PROBE_FAKE_SERVER_PATH;

struct CommandRun {
    int exit_code;
    std::string out;
    std::string err;
};

CommandRun Invoke(std::vector<const char*> args, const std::string& input = "") {
    args.insert(args.begin(), "mcp-probe");
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    const int code = RunCommand(static_cast<int>(args.size()), args.data(),
                                {in, out, err});
    return {code, out.str(), err.str()};
}

// Fake server mode plus a log of what it received, for this scope.
class ScopedFakeServer {
public:
    explicit ScopedFakeServer(const char* mode)
        : log_path_("/tmp/mcp_probe_cli_" + std::to_string(getpid()) + "_" + mode + ".log") {
        std::remove(log_path_.c_str());
        setenv("MCP_PROBE_FAKE_MODE", mode, 1);
        setenv("MCP_PROBE_FAKE_LOG", log_path_.c_str(), 1);
    }

    ~ScopedFakeServer() {
        unsetenv("MCP_PROBE_FAKE_MODE");
        unsetenv("MCP_PROBE_FAKE_LOG");
        std::remove(log_path_.c_str());
    }

    bool SawEof() const {
        std::ifstream in(log_path_);
        std::string line;
        while (std::getline(in, line)) {
            if (line == "<eof>") return true;
        }
        return false;
    }

private:
    std::string log_path_;
};

// Runs `hook` once, just before the first character is written.
class FirstWriteHookBuf : public std::stringbuf {
public:
    explicit FirstWriteHookBuf(std::function<void()> hook) : hook_(std::move(hook)) {}

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        Fire();
        return std::stringbuf::xsputn(s, n);
    }

    int_type overflow(int_type c) override {
        Fire();
        return std::stringbuf::overflow(c);
    }

private:
    void Fire() {
        if (hook_) {
            auto hook = std::move(hook_);
            hook_ = nullptr;
            hook();
        }
    }

    std::function<void()> hook_;
};

} // anonymous namespace

// ===========================================================================
// Subcommand parsing
// ===========================================================================

TEST_CASE("ParseSubcommand: explicit and implicit subcommands", "[cli][commands]") {
    const char* run[] = {"mcp-probe", "run", "--server", "x"};
    const char* norm[] = {"mcp-probe", "normalize"};
    const char* bare[] = {"mcp-probe", "--server", "x"};

    auto r = ParseSubcommand(4, run);
    CHECK(r.cmd == Subcommand::Run);
    CHECK(r.found_subcommand);

    auto n = ParseSubcommand(2, norm);
    CHECK(n.cmd == Subcommand::Normalize);
    CHECK(n.found_subcommand);

    auto b = ParseSubcommand(3, bare);
    CHECK(b.cmd == Subcommand::Run);
    CHECK_FALSE(b.found_subcommand);
}

TEST_CASE("StripSubcommand: drops only the subcommand token", "[cli][commands]") {
    const char* argv[] = {"mcp-probe", "run", "--server", "run"};
    auto stripped = StripSubcommand(4, argv, true);
    REQUIRE(stripped.size() == 3);
    CHECK(std::string(stripped[1]) == "--server");
    CHECK(std::string(stripped[2]) == "run");

    auto kept = StripSubcommand(4, argv, false);
    CHECK(kept.size() == 4);
}

// ===========================================================================
// Top level
// ===========================================================================

TEST_CASE("RunCommand: no arguments prints usage and exits 2", "[cli][commands]") {
    auto r = Invoke({});
    CHECK(r.exit_code == kExitUsage);
    CHECK(r.out.find("Usage:") != std::string::npos);
}

TEST_CASE("RunCommand: --version prints the version and exits 0", "[cli][commands]") {
    auto r = Invoke({"--version"});
    CHECK(r.exit_code == kExitSuccess);
    CHECK(r.out == std::string("mcp-probe ") + kVersion + "\n");
}

TEST_CASE("RunCommand: help exits 0", "[cli][commands]") {
    auto r = Invoke({"help"});
    CHECK(r.exit_code == kExitSuccess);
    CHECK(r.out.find("normalize") != std::string::npos);
}

// ===========================================================================
// normalize
// ===========================================================================

TEST_CASE("normalize: string content record exits 0", "[cli][commands]") {
    auto r = Invoke({"normalize"}, R"({"message":{"content":"hello world"}})" "\n");
    CHECK(r.exit_code == kExitSuccess);
    CHECK(r.out == "String content: 11 chars\nhello world...\n");
    CHECK(r.err.empty());
}

TEST_CASE("normalize: --json emits one JSON object", "[cli][commands]") {
    auto r = Invoke({"normalize", "--json"}, R"({"content":"direct"})");
    CHECK(r.exit_code == kExitSuccess);
    auto j = nlohmann::json::parse(r.out);
    CHECK(j["kind"] == "Direct");
    CHECK(j["character_count"] == 6);
}

TEST_CASE("normalize: a record without content still exits 0", "[cli][commands]") {
    auto r = Invoke({"normalize"}, "{}\n");
    CHECK(r.exit_code == kExitSuccess);
    CHECK(r.out == "No content found\n");
}

TEST_CASE("normalize: non-JSON input exits 1", "[cli][commands]") {
    auto r = Invoke({"normalize"}, "not json\n");
    CHECK(r.exit_code == kExitFailure);
    CHECK(r.out.empty());
    CHECK(r.err.find("protocol") != std::string::npos);
    CHECK(r.err.find("not json") != std::string::npos);
}

TEST_CASE("normalize: empty input exits 1", "[cli][commands]") {
    auto r = Invoke({"normalize"}, "");
    CHECK(r.exit_code == kExitFailure);
    CHECK(r.err.find("no input on stdin") != std::string::npos);
}

TEST_CASE("normalize: unknown flag exits 2", "[cli][commands]") {
    auto r = Invoke({"normalize", "--bogus"}, "{}\n");
    CHECK(r.exit_code == kExitUsage);
    CHECK(r.err.find("unknown argument: --bogus") != std::string::npos);
}

// ===========================================================================
// run: configuration errors
// ===========================================================================

TEST_CASE("run: missing --server exits 2", "[cli][commands]") {
    auto r = Invoke({"run", "--no-color"});
    CHECK(r.exit_code == kExitUsage);
    CHECK(r.err.find("config") != std::string::npos);
}

TEST_CASE("run: non-numeric timeout exits 2", "[cli][commands]") {
    auto r = Invoke({"run", "--server", kFakeServer, "--timeout-ms", "soon"});
    CHECK(r.exit_code == kExitUsage);
}

TEST_CASE("run: malformed config file exits 2", "[cli][commands]") {
    const std::string path = std::string(MCP_PROBE_TESTDATA_DIR) + "/invalid_config.yaml";
    auto r = Invoke({"run", "--config", path.c_str(), "--no-color"});
    CHECK(r.exit_code == kExitUsage);
    CHECK(r.err.find("config") != std::string::npos);
}

TEST_CASE("run: unreadable config file exits 2", "[cli][commands]") {
    auto r = Invoke({"run", "--config", "/nonexistent/mcp_probe.yaml"});
    CHECK(r.exit_code == kExitUsage);
}

// ===========================================================================
// run: against the fake server
// ===========================================================================

TEST_CASE("run: missing executable is a launch failure, exit 1", "[cli][commands]") {
    auto r = Invoke({"run", "--server", "/nonexistent/mcp-server", "--no-color"});
    CHECK(r.exit_code == kExitFailure);
    CHECK(r.err.find("launch") != std::string::npos);
    CHECK(r.out.empty());
}

TEST_CASE("run: conforming server passes with exit 0", "[cli][commands][e2e]") {
    ScopedFakeServer fake("ok");
    auto r = Invoke({"run", "--server", kFakeServer, "--no-color"});
    CHECK(r.exit_code == kExitSuccess);
    CHECK(r.out.find("PASS: ") != std::string::npos);
    CHECK(r.out.find("search_conversations") != std::string::npos);
}

TEST_CASE("run: --json --quiet report is a single JSON document", "[cli][commands][e2e]") {
    ScopedFakeServer fake("ok");
    auto r = Invoke({"--server", kFakeServer, "--json", "--quiet"});
    CHECK(r.exit_code == kExitSuccess);
    auto j = nlohmann::json::parse(r.out);
    CHECK(j["success"] == true);
    CHECK(j["exit_code"] == 0);
    CHECK(j["steps"].size() == 6);
}

TEST_CASE("run: initialize error fails with exit 1", "[cli][commands][e2e]") {
    ScopedFakeServer fake("error_on_initialize");
    auto r = Invoke({"run", "--server", kFakeServer, "--no-color"});
    CHECK(r.exit_code == kExitFailure);
    CHECK(r.out.find("FAIL: ") != std::string::npos);
}

TEST_CASE("run: server is shut down before the report is written", "[cli][commands][e2e]") {
    ScopedFakeServer fake("ok");
    bool eof_before_report = false;
    FirstWriteHookBuf buf([&] { eof_before_report = fake.SawEof(); });
    std::ostream out(&buf);
    std::istringstream in;
    std::ostringstream err;

    const char* argv[] = {"mcp-probe", "run", "--server", kFakeServer, "--no-color"};
    const int code = RunCommand(5, argv, {in, out, err});

    CHECK(code == kExitSuccess);
    CHECK(eof_before_report);
    CHECK(buf.str().find("PASS: ") != std::string::npos);
}
