//
// betterassert.hh
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
#include "boson/PlatformCompat.hh"
#include <stdexcept>

// Contract checks for conditions that only a bug can violate. Both stay enabled when `NDEBUG`
// is defined. A failure prints the condition, function, file and line to stderr, then throws.
//
// * `precondition(e)` checks a function's arguments or the state it was called in, and throws
//   `std::invalid_argument`: the caller is at fault.
// * `postcondition(e)` checks a function's result or the state it leaves behind, and throws
//   `boson::assertion_failure`: the function itself is at fault.
//
// Malformed input is not a contract violation; it's reported with BosonException.

#ifdef _MSC_VER
    #define BOSON_FUNCTION_NAME __FUNCSIG__
#else
    #define BOSON_FUNCTION_NAME __PRETTY_FUNCTION__
#endif

#define precondition(e) ((void)  (_usuallyTrue(!!(e)) ? ((void)0) \
                            : ::boson::_precondition_failed(#e, BOSON_FUNCTION_NAME, __FILE__, __LINE__)))
#define postcondition(e) ((void) (_usuallyTrue(!!(e)) ? ((void)0) \
                            : ::boson::_postcondition_failed(#e, BOSON_FUNCTION_NAME, __FILE__, __LINE__)))

namespace boson {

    [[noreturn]] NOINLINE void _precondition_failed(const char *condition, const char *fn,
                                                    const char *file, int line);
    [[noreturn]] NOINLINE void _postcondition_failed(const char *condition, const char *fn,
                                                     const char *file, int line);

    /// Thrown by a failed `postcondition`.
    class assertion_failure : public std::logic_error {
    public:
        explicit assertion_failure(const std::string &what) :logic_error(what) { }
    };

}
