//
// Base.h
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#ifndef BOSON_BASE_H
#define BOSON_BASE_H

// The __has_xxx() macros are only(?) implemented by Clang. (Except GCC has __has_attribute...)
// Define them to return 0 on other compilers.

#ifndef __has_attribute
    #define __has_attribute(x) 0
#endif


#if defined(__clang__) || defined(__GNUC__)
    // These have no effect on behavior, but they hint to the optimizer which branch of an 'if'
    // statement to make faster.
    #define _usuallyTrue(VAL)               __builtin_expect(VAL, true)
    #define _usuallyFalse(VAL)              __builtin_expect(VAL, false)
#else
    #define _usuallyTrue(VAL)               (VAL)
    #define _usuallyFalse(VAL)              (VAL)
#endif


// BOSON_PURE functions are _read-only_. They cannot write to memory (in a way that's detectable),
// and they cannot access volatile data or do I/O.
//
// Calling a BOSON_PURE function twice in a row with the same arguments must return the same
// result.
#if defined(__GNUC__) || __has_attribute(__pure__)
    #define BOSON_PURE                  __attribute__((__pure__))
#else
    #define BOSON_PURE
#endif

// BOSON_CONST is even stricter than BOSON_PURE. The function cannot access memory at all (except
// for reading immutable values like constants.) The return value can only depend on the
// parameters, so such functions should never take pointer or reference arguments.
#if defined(__GNUC__) || __has_attribute(__const__)
    #define BOSON_CONST                 __attribute__((__const__))
#else
    #define BOSON_CONST
#endif


// STEPOVER is for trivial little glue functions that are annoying to step into in the debugger
// on the way to the function you _do_ want to step into, such as slice constructors.
#if __has_attribute(nodebug)
    #define STEPOVER __attribute((nodebug))
#else
    #define STEPOVER
#endif


// `__cold` marks a function as being rarely used (e.g. error handling.) Optimizes it for size and
// moves it to a common code section for cold functions. Has no effect in an unoptimized build.
#ifndef __cold
#   if defined(__OPTIMIZE__) && (defined(__GNUC__) || __has_attribute(__cold__))
#       define __cold __attribute__((__cold__))
#   else
#       define __cold
#   endif
#endif /* __cold */

// `__hot` marks a function as being a hot-spot. Has no effect in an unoptimized build.
#ifndef __hot
#   if defined(__OPTIMIZE__) && (defined(__GNUC__) || __has_attribute(__hot__))
#       define __hot __attribute__((__hot__))
#   else
#       define __hot
#   endif
#endif /* __hot */

#endif // BOSON_BASE_H
