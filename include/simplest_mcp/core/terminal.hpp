#pragma once

namespace simplest_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdin is a terminal (interactive session).
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output is colored: an explicit --color/--no-color
/// wins, then NO_COLOR, then whether stderr is a terminal.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace simplest_mcp
