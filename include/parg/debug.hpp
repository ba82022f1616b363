#ifndef PARG_DEBUG_HPP
#define PARG_DEBUG_HPP

#ifdef PARG_DEBUG_LOGGING
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace parg::debug {

// Tracing is compiled in by PARG_DEBUG_LOGGING and switched on at run time with PARG_DEBUG=1.
inline bool enabled() {
    static const bool on = [] {
        const char* env = std::getenv("PARG_DEBUG");
        return env != nullptr && env[0] == '1';
    }();
    return on;
}

constexpr const char* shortenPath(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

inline void printAll(std::ostream&) {}

template <typename T, typename... Rest>
void printAll(std::ostream& os, T&& first, Rest&&... rest) {
    os << std::forward<T>(first);
    printAll(os, std::forward<Rest>(rest)...);
}

} // namespace parg::debug

#define PARG_DEBUG_LOG(...)                                                                      \
    do {                                                                                         \
        if (::parg::debug::enabled()) {                                                          \
            std::ostringstream parg_debug_oss;                                                   \
            parg_debug_oss << "[parg " << ::parg::debug::shortenPath(__FILE__) << ":" << __LINE__ \
                           << "] ";                                                              \
            ::parg::debug::printAll(parg_debug_oss, __VA_ARGS__);                                \
            std::cerr << parg_debug_oss.str() << std::endl;                                      \
        }                                                                                        \
    } while (0)

#else // !PARG_DEBUG_LOGGING

#define PARG_DEBUG_LOG(...) \
    do {                    \
    } while (0)

#endif

#endif // PARG_DEBUG_HPP
