#include <mica/utils.hh>
#include <mica/utils/platform.hh>

#include <cstdio>
#include <cstdlib>

#ifdef __linux__
#    include <execinfo.h>
#    include <unistd.h>
#endif

void mica::platform::PrintBacktrace() {
#ifdef __linux__
    static constexpr int size = 64;
    void* trace[size]{};
    int n = backtrace(trace, size);

    char** symbols = backtrace_symbols(trace, n);
    if (not symbols) {
        for (int i = 0; i < n; ++i)
            fmt::print(stderr, "{}: {}\n", i, trace[i]);
        return;
    }

    // Skip this function.
    for (int i = 1; i < n; ++i)
        fmt::print(stderr, "{}: {}\n", i - 1, symbols[i]);

    std::free(symbols);
#endif
}

bool mica::platform::StderrIsTerminal() {
#ifdef __linux__
    return isatty(fileno(stderr));
#else
    return false;
#endif
}
