/*
 * Copyright (c) 2021, Andreas Kling <kling@serenityos.org>
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <chunkfeed/core/errors/Asserts.hpp>
#include <chunkfeed/core/errors/Diagnostics.hpp>
#include <nonstd/expected.hpp>
#include <optional>

namespace cfd::error_detail {
template<typename T>
static inline __attribute__((always_inline)) std::nullopt_t extract_error(std::optional<T>&&) {
    return std::nullopt;
}

// Only the error travels back, so the enclosing function may return an
// expected with a different value type (or an AnyExpected).
template<typename T, typename E>
static inline __attribute__((always_inline)) nonstd::unexpected_type<E>
extract_error(nonstd::expected<T, E>&& err) {
    return nonstd::make_unexpected(std::move(err).error());
}

} // namespace cfd::error_detail

// NOTE: This macro works with any result type that has the expected APIs.
//
//       It depends on a non-standard C++ extension, specifically
//       on statement expressions [1]. This is known to be implemented
//       by at least clang and gcc.
//       [1] https://gcc.gnu.org/onlinedocs/gcc/Statement-Exprs.html
//
//       The statement expression always yields a copy (or move) of the
//       contained value, never a reference into the temporary.
#define TRY(expression) \
    ({ \
        /* Ignore -Wshadow to allow nesting the macro. */ \
        CFD_IGNORE_DIAGNOSTIC("-Wshadow", auto&& _temporary_result = (expression)); \
        if (!_temporary_result.has_value()) [[unlikely]] \
            return cfd::error_detail::extract_error(std::move(_temporary_result)); \
        std::move(_temporary_result.value()); \
    })

#define MUST(expression) \
    ({ \
        /* Ignore -Wshadow to allow nesting the macro. */ \
        CFD_IGNORE_DIAGNOSTIC("-Wshadow", auto&& _temporary_result = (expression)); \
        CFD_ASSERT(_temporary_result.has_value(), "Expected contains an error"); \
        std::move(_temporary_result.value()); \
    })
