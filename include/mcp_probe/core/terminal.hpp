#pragma once

namespace mcp_probe {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored report output).
bool IsStdoutTty();

/// Returns true if stdin is a terminal (normalize reads a record from it).
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the color decision from explicit flags, NO_COLOR and the TTY state.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace mcp_probe
