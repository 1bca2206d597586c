#include <mcp_probe/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_probe {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdoutTty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool IsStdinTty() {
    return isatty(STDIN_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveColor(bool force_color, bool force_no_color, bool is_tty) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || is_tty;
}

} // namespace mcp_probe
