#pragma once

namespace cinegraph {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored table/error output).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color decision shared by log and table output: an explicit --no-color or
/// NO_COLOR wins, then --color, then whether the stream is a terminal.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace cinegraph
