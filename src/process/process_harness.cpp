#include <mcp_probe/process/process_harness.hpp>

#include <mcp_probe/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp_probe {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kComponent = "harness";
constexpr std::size_t kReadChunk = 4096;
constexpr std::size_t kMaxStderrLine = 4096;
constexpr std::size_t kStderrTailInError = 512;
constexpr auto kWaitPollInterval = std::chrono::milliseconds{10};

Error LaunchError(const std::string& path, const std::string& message) {
    auto e = Error::Make(ErrorCategory::Launch, "ProcessHarness::Start",
                         message);
    e.method = path;
    return e;
}

Error IoError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorCategory::Io, operation, message);
}

std::string ErrnoText(int err) {
    return std::strerror(err);
}

bool MakePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end = FileDescriptor(fds[0]);
    write_end = FileDescriptor(fds[1]);
    return true;
}

// A dead peer must surface as EPIPE from write(), not kill the harness.
void IgnoreSigpipe() {
    struct sigaction sa {};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGPIPE, &sa, nullptr);
}

std::string StderrTail(const std::string& captured) {
    if (captured.empty()) return "";
    auto start = captured.size() > kStderrTailInError
                     ? captured.size() - kStderrTailInError
                     : 0;
    return "; stderr tail: " + captured.substr(start);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FileDescriptor
// ---------------------------------------------------------------------------
void FileDescriptor::Close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ProcessHarness>, Error> ProcessHarness::Start(
    const std::string& executable_path, const ProcessOptions& options) {
    using R = Result<std::unique_ptr<ProcessHarness>, Error>;

    if (executable_path.empty()) {
        return R::Err(LaunchError(executable_path, "empty executable path"));
    }

    struct stat st {};
    if (::stat(executable_path.c_str(), &st) != 0) {
        return R::Err(LaunchError(executable_path,
            "executable not found: " + executable_path + " (" +
            ErrnoText(errno) + ")"));
    }
    if (!S_ISREG(st.st_mode)) {
        return R::Err(LaunchError(executable_path,
            "not a regular file: " + executable_path));
    }
    if (::access(executable_path.c_str(), X_OK) != 0) {
        return R::Err(LaunchError(executable_path,
            "not executable: " + executable_path + " (" +
            ErrnoText(errno) + ")"));
    }

    IgnoreSigpipe();

    FileDescriptor in_read, in_write;
    FileDescriptor out_read, out_write;
    FileDescriptor err_read, err_write;
    FileDescriptor exec_read, exec_write;
    if (!MakePipe(in_read, in_write) || !MakePipe(out_read, out_write) ||
        !MakePipe(err_read, err_write) || !MakePipe(exec_read, exec_write)) {
        return R::Err(LaunchError(executable_path,
            "pipe2 failed: " + ErrnoText(errno)));
    }

    const char* path = executable_path.c_str();
    const pid_t pid = ::fork();
    if (pid < 0) {
        return R::Err(LaunchError(executable_path,
            "fork failed: " + ErrnoText(errno)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until execv.
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_read.Get(), STDIN_FILENO);
        ::dup2(out_write.Get(), STDOUT_FILENO);
        ::dup2(err_write.Get(), STDERR_FILENO);

        char* argv[] = {const_cast<char*>(path), nullptr};
        ::execv(path, argv);

        // exec_write is close-on-exec; reaching here means execv failed.
        const int err = errno;
        const ssize_t ignored = ::write(exec_write.Get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    in_read.Close();
    out_write.Close();
    err_write.Close();
    exec_write.Close();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_read.Get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return R::Err(LaunchError(executable_path,
            "execv failed for " + executable_path + ": " +
            ErrnoText(exec_errno)));
    }

    LogInfo(kComponent, "started " + executable_path + " (pid " +
                        std::to_string(pid) + ")");

    return R::Ok(std::unique_ptr<ProcessHarness>(new ProcessHarness(
        executable_path, pid, std::move(in_write), std::move(out_read),
        std::move(err_read), options)));
}

ProcessHarness::ProcessHarness(std::string path, pid_t pid,
                               FileDescriptor stdin_fd,
                               FileDescriptor stdout_fd,
                               FileDescriptor stderr_fd,
                               const ProcessOptions& options)
    : path_(std::move(path)),
      pid_(pid),
      stdin_(std::move(stdin_fd)),
      stdout_(std::move(stdout_fd)),
      stderr_(std::move(stderr_fd)),
      options_(options) {}

ProcessHarness::~ProcessHarness() {
    Terminate();
}

// ---------------------------------------------------------------------------
// Line I/O
// ---------------------------------------------------------------------------
Result<void, Error> ProcessHarness::SendLine(std::string_view text) {
    if (!stdin_.IsValid()) {
        return Result<void, Error>::Err(
            IoError("ProcessHarness::SendLine", "server stdin is closed"));
    }

    std::string frame(text);
    frame.push_back('\n');

    const char* data = frame.data();
    std::size_t remaining = frame.size();
    while (remaining > 0) {
        const ssize_t n = ::write(stdin_.Get(), data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            if (err == EPIPE) {
                return Result<void, Error>::Err(IoError(
                    "ProcessHarness::SendLine",
                    "server closed its stdin" + StderrTail(stderr_capture_)));
            }
            return Result<void, Error>::Err(
                IoError("ProcessHarness::SendLine", "write failed: " + ErrnoText(err)));
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

std::optional<std::string> ProcessHarness::TakeBufferedLine() {
    auto pos = stdout_buffer_.find('\n');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string line = stdout_buffer_.substr(0, pos);
    stdout_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

Result<std::string, Error> ProcessHarness::ReadLine(
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<std::string, Error>;

    const auto start = Clock::now();
    while (true) {
        if (auto line = TakeBufferedLine()) {
            return R::Ok(std::move(*line));
        }

        if (stdout_eof_ || !stdout_.IsValid()) {
            if (!stdout_buffer_.empty()) {
                std::string rest = std::move(stdout_buffer_);
                stdout_buffer_.clear();
                if (rest.back() == '\r') rest.pop_back();
                return R::Ok(std::move(rest));
            }
            return R::Err(Error::Make(ErrorCategory::EndOfStream,
                "ProcessHarness::ReadLine",
                "server closed stdout before a line arrived" +
                StderrTail(stderr_capture_)));
        }

        int wait_ms = -1;
        if (timeout.has_value()) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - start);
            if (elapsed >= *timeout) {
                return R::Err(Error::Make(ErrorCategory::Timeout,
                    "ProcessHarness::ReadLine",
                    "no line from server within " +
                    std::to_string(timeout->count()) + "ms"));
            }
            wait_ms = static_cast<int>(std::min<long long>(
                (*timeout - elapsed).count(), INT_MAX));
        }

        struct pollfd fds[2];
        fds[0].fd = stdout_.Get();
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = stderr_.IsValid() ? stderr_.Get() : -1;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        const int rc = ::poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return R::Err(IoError("ProcessHarness::ReadLine",
                                  "poll failed: " + ErrnoText(errno)));
        }
        if (rc == 0) {
            continue;
        }

        if (fds[1].fd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            char buf[kReadChunk];
            const ssize_t n = ::read(stderr_.Get(), buf, sizeof(buf));
            if (n > 0) {
                ConsumeStderr(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                FlushStderrLine();
                stderr_.Close();
            }
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            char buf[kReadChunk];
            const ssize_t n = ::read(stdout_.Get(), buf, sizeof(buf));
            if (n > 0) {
                stdout_buffer_.append(buf, static_cast<std::size_t>(n));
            } else if (n == 0) {
                stdout_eof_ = true;
            } else if (errno != EINTR) {
                return R::Err(IoError("ProcessHarness::ReadLine",
                                      "read failed: " + ErrnoText(errno)));
            }
        }
    }
}

// ---------------------------------------------------------------------------
// stderr capture
// ---------------------------------------------------------------------------
void ProcessHarness::ConsumeStderr(const char* data, std::size_t size) {
    if (stderr_capture_.size() < options_.stderr_capture_bytes) {
        const auto room = options_.stderr_capture_bytes - stderr_capture_.size();
        stderr_capture_.append(data, std::min(room, size));
    }
    for (std::size_t i = 0; i < size; ++i) {
        if (data[i] == '\n') {
            FlushStderrLine();
        } else {
            stderr_line_.push_back(data[i]);
            if (stderr_line_.size() >= kMaxStderrLine) {
                FlushStderrLine();
            }
        }
    }
}

void ProcessHarness::FlushStderrLine() {
    if (!stderr_line_.empty()) {
        LogDebug("server", stderr_line_);
        stderr_line_.clear();
    }
}

void ProcessHarness::DrainStderrNonBlocking() {
    while (stderr_.IsValid()) {
        struct pollfd pfd;
        pfd.fd = stderr_.Get();
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int rc = ::poll(&pfd, 1, 0);
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) return;

        char buf[kReadChunk];
        const ssize_t n = ::read(stderr_.Get(), buf, sizeof(buf));
        if (n > 0) {
            ConsumeStderr(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        stderr_.Close();
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
void ProcessHarness::RecordExit(int status) {
    TerminationResult result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    termination_ = result;
}

std::optional<TerminationResult> ProcessHarness::WaitTimeout(
    std::chrono::milliseconds timeout) {
    if (termination_.has_value()) {
        return termination_;
    }

    const auto deadline = Clock::now() + timeout;
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            RecordExit(status);
            return termination_;
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            // ECHILD: nothing left to reap.
            termination_ = TerminationResult{};
            return termination_;
        }
        if (Clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(kWaitPollInterval);
    }
}

TerminationResult ProcessHarness::Terminate() {
    if (termination_.has_value()) {
        return *termination_;
    }

    // EOF on stdin is the polite shutdown request for a stdio server.
    stdin_.Close();

    if (!WaitTimeout(std::chrono::milliseconds{0}).has_value()) {
        ::kill(pid_, SIGTERM);
        if (!WaitTimeout(options_.shutdown_timeout).has_value()) {
            LogWarn(kComponent, "pid " + std::to_string(pid_) +
                    " still alive " + std::to_string(options_.shutdown_timeout.count()) +
                    "ms after SIGTERM, sending SIGKILL");
            ::kill(pid_, SIGKILL);
            int status = 0;
            pid_t r = -1;
            do {
                r = ::waitpid(pid_, &status, 0);
            } while (r < 0 && errno == EINTR);
            if (r == pid_) {
                RecordExit(status);
            } else {
                termination_ = TerminationResult{};
            }
            termination_->force_killed = true;
        }
    }

    DrainStderrNonBlocking();
    FlushStderrLine();
    stdout_.Close();
    stderr_.Close();

    const auto& t = *termination_;
    if (t.exit_code.has_value()) {
        LogDebug(kComponent, "pid " + std::to_string(pid_) + " exited with code " +
                             std::to_string(*t.exit_code));
    } else if (t.term_signal.has_value()) {
        LogDebug(kComponent, "pid " + std::to_string(pid_) + " terminated by signal " +
                             std::to_string(*t.term_signal));
    }
    return t;
}

} // namespace mcp_probe
