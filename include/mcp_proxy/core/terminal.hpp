#pragma once

namespace mcp_proxy {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

// Colored console logs: stderr is a TTY, NO_COLOR is unset and the user did
// not pass --no-color.
bool ConsoleColorEnabled(bool disabled_by_flag);

} // namespace mcp_proxy
