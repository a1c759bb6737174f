#ifndef MICA_PLATFORM_HH
#define MICA_PLATFORM_HH

/// No system headers here; the implementation picks them per platform.

namespace mica::platform {
/// Print a stack trace to stderr.
void PrintBacktrace();

/// Check whether stderr is a terminal.
bool StderrIsTerminal();
} // namespace mica::platform

#endif // MICA_PLATFORM_HH
