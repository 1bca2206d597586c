#pragma once

#include <mcp_probe/process/i_line_channel.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <sys/types.h>

namespace mcp_probe {

// ---------------------------------------------------------------------------
// FileDescriptor - move-only owner of a POSIX descriptor.
// ---------------------------------------------------------------------------
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.Release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = other.Release();
        }
        return *this;
    }

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool IsValid() const noexcept { return fd_ >= 0; }

    int Release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Close() noexcept;

private:
    int fd_ = -1;
};

// ---------------------------------------------------------------------------
// ProcessOptions - lifecycle bounds for the child process.
// ---------------------------------------------------------------------------
struct ProcessOptions {
    std::chrono::milliseconds shutdown_timeout{5000};
    std::size_t stderr_capture_bytes = 64 * 1024;
};

// ---------------------------------------------------------------------------
// TerminationResult - how the child went away.
// ---------------------------------------------------------------------------
struct TerminationResult {
    std::optional<int> exit_code;    // set when the child exited normally
    std::optional<int> term_signal;  // set when a signal ended it
    bool force_killed = false;       // SIGKILL was needed after the timeout
};

// ---------------------------------------------------------------------------
// ProcessHarness - owns one child process and its three standard streams.
//
// The child is started with no arguments and stdin/stdout/stderr redirected
// to pipes. Lines are written straight to the pipe descriptor, so the peer
// sees each frame as soon as SendLine returns. While ReadLine waits, the
// child's stderr is drained into a bounded buffer and logged at debug level
// (component "server"), so a chatty peer cannot stall on a full pipe.
//
// The destructor calls Terminate(): every exit path releases the process
// and all descriptors.
// ---------------------------------------------------------------------------
class ProcessHarness : public ILineChannel {
public:
    // Launch `executable_path`. Fails with ErrorCategory::Launch when the
    // path is missing, not a regular executable file, or execv fails.
    [[nodiscard]] static Result<std::unique_ptr<ProcessHarness>, Error> Start(
        const std::string& executable_path,
        const ProcessOptions& options = {});

    ~ProcessHarness() override;

    // -- ILineChannel --------------------------------------------------------

    [[nodiscard]] Result<void, Error> SendLine(std::string_view text) override;

    [[nodiscard]] Result<std::string, Error> ReadLine(
        std::optional<std::chrono::milliseconds> timeout) override;

    // -- Lifecycle -----------------------------------------------------------

    // Wait up to `timeout` for the child to exit. Returns the termination
    // state if it did, nullopt if it is still running.
    [[nodiscard]] std::optional<TerminationResult> WaitTimeout(
        std::chrono::milliseconds timeout);

    // Close stdin, SIGTERM, WaitTimeout(shutdown_timeout), then SIGKILL if
    // still alive. Idempotent: later calls return the first outcome.
    TerminationResult Terminate();

    // True until the child has been reaped.
    [[nodiscard]] bool IsRunning() const noexcept { return !termination_.has_value(); }
    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& ExecutablePath() const noexcept { return path_; }

    // Everything captured from the child's stderr so far (bounded).
    [[nodiscard]] const std::string& CapturedStderr() const noexcept {
        return stderr_capture_;
    }

private:
    ProcessHarness(std::string path, pid_t pid, FileDescriptor stdin_fd,
                   FileDescriptor stdout_fd, FileDescriptor stderr_fd,
                   const ProcessOptions& options);

    std::optional<std::string> TakeBufferedLine();
    void ConsumeStderr(const char* data, std::size_t size);
    void DrainStderrNonBlocking();
    void FlushStderrLine();
    void RecordExit(int status);

    std::string path_;
    pid_t pid_ = -1;
    FileDescriptor stdin_;
    FileDescriptor stdout_;
    FileDescriptor stderr_;
    ProcessOptions options_;

    std::string stdout_buffer_;
    std::string stderr_line_;
    std::string stderr_capture_;
    bool stdout_eof_ = false;
    std::optional<TerminationResult> termination_;
};

} // namespace mcp_probe
