#pragma once

namespace pulsar_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve log coloring from --color/--no-color flags, NO_COLOR and the
/// stderr TTY check. --no-color and NO_COLOR win over --color.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace pulsar_mcp
