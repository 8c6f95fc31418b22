#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

template <typename... Args>
[[noreturn]] static void chunkfeed_assert(const char* file, int line, const char* assertion,
                                          fmt::format_string<Args...> fmt, Args&&... args)
{
    std::string msg = fmt::format(fmt, std::forward<Args>(args)...);

    fmt::print(stderr, "{}:{} - Assertion '{}' failed: {}\n", file, line, assertion, msg);
    std::terminate();
}

// Programming errors only. Data-dependent failures go through Expected.
#define CFD_ASSERT(expression, text, args...)                                  \
    if (!(expression))                                                         \
    {                                                                          \
        chunkfeed_assert(__FILE__, __LINE__, #expression, FMT_STRING(text),    \
                         ##args);                                              \
    }
