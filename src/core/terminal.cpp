#include <simplest_mcp/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace simplest_mcp {

bool IsStderrTty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool IsStdinTty() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveLogColor(bool force_color, bool force_no_color) {
    if (force_no_color) return false;
    if (force_color) return true;
    if (NoColorEnvSet()) return false;
    return IsStderrTty();
}

} // namespace simplest_mcp
