#include <catch2/catch_test_macros.hpp>

#include <mcp_probe/process/process_harness.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

using namespace mcp_probe;
using namespace std::chrono_literals;

namespace {

constexpr const char* kFakeServer = MCP_PROBE_FAKE_SERVER_PATH;

// Sets MCP_PROBE_FAKE_MODE for children started in this scope.
class ScopedFakeMode {
public:
    explicit ScopedFakeMode(const char* mode) { setenv("MCP_PROBE_FAKE_MODE", mode, 1); }
    ~ScopedFakeMode() { unsetenv("MCP_PROBE_FAKE_MODE"); }
};

std::unique_ptr<ProcessHarness> StartOrFail(const std::string& path,
                                            const ProcessOptions& options = {}) {
    auto r = ProcessHarness::Start(path, options);
    REQUIRE(r.IsOk());
    return std::move(r).Value();
}

} // anonymous namespace

// ===========================================================================
// Launch failures
// ===========================================================================

TEST_CASE("ProcessHarness: missing executable is a launch error", "[process]") {
    auto r = ProcessHarness::Start("/nonexistent/mcp-server");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Launch);
    CHECK(r.Error().message.find("/nonexistent/mcp-server") != std::string::npos);
}

TEST_CASE("ProcessHarness: empty path is a launch error", "[process]") {
    auto r = ProcessHarness::Start("");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Launch);
}

TEST_CASE("ProcessHarness: directory is a launch error", "[process]") {
    auto r = ProcessHarness::Start("/tmp");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Launch);
}

TEST_CASE("ProcessHarness: non-executable file is a launch error", "[process]") {
    const std::string path = "/tmp/mcp_probe_not_exec_" + std::to_string(getpid());
    { std::ofstream(path) << "#!/bin/sh\n"; }
    ::chmod(path.c_str(), 0644);

    auto r = ProcessHarness::Start(path);
    std::remove(path.c_str());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Launch);
}

// ===========================================================================
// Line I/O
// ===========================================================================

TEST_CASE("ProcessHarness: lines round-trip through cat", "[process]") {
    auto proc = StartOrFail("/bin/cat");
    CHECK(proc->IsRunning());
    CHECK(proc->Pid() > 0);
    CHECK(proc->ExecutablePath() == "/bin/cat");

    REQUIRE(proc->SendLine(R"({"jsonrpc":"2.0","id":1})").IsOk());
    REQUIRE(proc->SendLine("second").IsOk());

    auto first = proc->ReadLine(5000ms);
    REQUIRE(first.IsOk());
    CHECK(first.Value() == R"({"jsonrpc":"2.0","id":1})");

    auto second = proc->ReadLine(5000ms);
    REQUIRE(second.IsOk());
    CHECK(second.Value() == "second");
}

TEST_CASE("ProcessHarness: ReadLine times out on a silent peer", "[process]") {
    auto proc = StartOrFail("/bin/cat");

    const auto start = std::chrono::steady_clock::now();
    auto r = proc->ReadLine(100ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(elapsed >= 100ms);
    CHECK(proc->IsRunning());
}

TEST_CASE("ProcessHarness: ReadLine reports end of stream", "[process]") {
    ScopedFakeMode mode("exit_3");
    auto proc = StartOrFail(kFakeServer);

    auto r = proc->ReadLine(5000ms);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::EndOfStream);

    auto t = proc->WaitTimeout(5000ms);
    REQUIRE(t.has_value());
    CHECK(t->exit_code == std::optional<int>(3));
    CHECK_FALSE(proc->IsRunning());
}

TEST_CASE("ProcessHarness: SendLine to an exited peer is an I/O error", "[process]") {
    auto proc = StartOrFail("/bin/true");
    REQUIRE(proc->WaitTimeout(5000ms).has_value());

    auto r = proc->SendLine("anyone there?");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
}

TEST_CASE("ProcessHarness: stderr is drained and bounded", "[process]") {
    ScopedFakeMode mode("stderr_flood");
    ProcessOptions options;
    options.stderr_capture_bytes = 1024;
    auto proc = StartOrFail(kFakeServer, options);

    // The peer writes 256KiB to stderr before reading stdin.
    REQUIRE(proc->SendLine(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})").IsOk());
    auto r = proc->ReadLine(10000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().find("\"id\":1") != std::string::npos);
    CHECK(proc->CapturedStderr().size() == 1024);
}

// ===========================================================================
// Shutdown
// ===========================================================================

TEST_CASE("ProcessHarness: Terminate stops a cooperative peer", "[process]") {
    auto proc = StartOrFail("/bin/cat");
    auto t = proc->Terminate();

    CHECK_FALSE(t.force_killed);
    CHECK((t.exit_code.has_value() || t.term_signal.has_value()));
    CHECK_FALSE(proc->IsRunning());

    // Idempotent.
    auto again = proc->Terminate();
    CHECK(again.exit_code == t.exit_code);
    CHECK(again.term_signal == t.term_signal);
}

TEST_CASE("ProcessHarness: Terminate force-kills a peer ignoring SIGTERM", "[process]") {
    ScopedFakeMode mode("ignore_term");
    ProcessOptions options;
    options.shutdown_timeout = 200ms;
    auto proc = StartOrFail(kFakeServer, options);

    // Wait for the peer to install its handler before terminating.
    REQUIRE(proc->SendLine(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})").IsOk());
    CHECK(proc->ReadLine(300ms).IsErr());

    auto t = proc->Terminate();
    CHECK(t.force_killed);
    CHECK(t.term_signal == std::optional<int>(SIGKILL));
}

TEST_CASE("ProcessHarness: destructor reaps the child", "[process]") {
    pid_t pid = -1;
    {
        auto proc = StartOrFail("/bin/cat");
        pid = proc->Pid();
        REQUIRE(::kill(pid, 0) == 0);
    }
    CHECK(::kill(pid, 0) == -1);
}
