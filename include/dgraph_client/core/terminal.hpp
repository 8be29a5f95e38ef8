#pragma once

namespace dgraph_client {

/// True if stderr is a terminal (colored log output).
bool IsStderrTty();

/// True if stdout is a terminal (colored result output).
bool IsStdoutTty();

/// True if NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the color decision from --color/--no-color flags, NO_COLOR and
/// whether the target stream is a terminal.
bool ResolveUseColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace dgraph_client
