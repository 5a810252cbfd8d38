#include <mcp_proxy/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_proxy {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ConsoleColorEnabled(bool disabled_by_flag) {
    return !disabled_by_flag && !NoColorEnvSet() && IsStderrTty();
}

} // namespace mcp_proxy
