#ifndef LAZYJSON_COMMON_ASSERT_H
#define LAZYJSON_COMMON_ASSERT_H

#include <cstdio>
#include <cstdlib>
#include <version>

#if defined(__cpp_lib_stacktrace)
#include <iostream>
#include <stacktrace>
#endif

namespace lazyjson::common {

inline void dump_stacktrace() {
#if defined(__cpp_lib_stacktrace)
    std::fprintf(stderr, "stacktrace:\n");
    std::cerr << std::stacktrace::current() << '\n';
#else
    std::fprintf(stderr, "stacktrace: unavailable\n");
#endif
    std::fflush(stderr);
}

// Internal invariant violations only; malformed input is reported through JsonResult.
[[noreturn]] inline void panic_assert(const char *expr, const char *message, const char *file, int line,
                                      const char *func) {
    if (message) {
        std::fprintf(stderr, "LAZYJSON_ASSERT failed: %s\n  message: %s\n  at %s:%d (%s)\n", expr, message, file,
                     line, func);
    } else {
        std::fprintf(stderr, "LAZYJSON_ASSERT failed: %s\n  at %s:%d (%s)\n", expr, file, line, func);
    }
    dump_stacktrace();
    std::abort();
}

[[noreturn]] inline void panic_message(const char *message, const char *file, int line, const char *func) {
    std::fprintf(stderr, "LAZYJSON_PANIC: %s\n  at %s:%d (%s)\n", message, file, line, func);
    dump_stacktrace();
    std::abort();
}

} // namespace lazyjson::common

#define LAZYJSON_ASSERT(expr) \
    do { \
        if (!(expr)) { \
            ::lazyjson::common::panic_assert(#expr, nullptr, __FILE__, __LINE__, __func__); \
        } \
    } while (false)

#define LAZYJSON_ASSERT_MSG(expr, message) \
    do { \
        if (!(expr)) { \
            ::lazyjson::common::panic_assert(#expr, (message), __FILE__, __LINE__, __func__); \
        } \
    } while (false)

#define LAZYJSON_PANIC(message) \
    do { \
        ::lazyjson::common::panic_message((message), __FILE__, __LINE__, __func__); \
    } while (false)

#endif // LAZYJSON_COMMON_ASSERT_H
