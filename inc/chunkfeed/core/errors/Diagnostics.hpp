/*
 * Copyright (c) 2022, Linus Groh <linusg@serenityos.org>
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

// Needed to turn the 'name' token and the preceding 'GCC diagnostic ignored'
// into a single string literal, it won't accept "foo"#bar concatenation.
#define _CFD_PRAGMA(x) _Pragma(#x)
#define CFD_PRAGMA(x) _CFD_PRAGMA(x)

// Temporarily disable a diagnostic for the given statement. Usable from
// inside other macros.
// NOTE: 'GCC' is also recognized by clang.
#define CFD_IGNORE_DIAGNOSTIC(name, statement) \
    CFD_PRAGMA(GCC diagnostic push);           \
    CFD_PRAGMA(GCC diagnostic ignored name);   \
    statement;                                 \
    CFD_PRAGMA(GCC diagnostic pop);

// Exhaustive switches over enum classes carry no default label
#define CFD_BEGIN_NO_DEFAULT_CASE()  \
    CFD_PRAGMA(GCC diagnostic push); \
    CFD_PRAGMA(GCC diagnostic ignored "-Wswitch-default");

#define CFD_END_NO_DEFAULT_CASE() CFD_PRAGMA(GCC diagnostic pop);
