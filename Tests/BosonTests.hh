//
// BosonTests.hh
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once

#include "boson/slice.hh"
#include "BosonException.hh"
#include <ostream>
#include <string>
#include <vector>

using namespace boson;


namespace boson_test {
    /// Formats bytes as uppercase hex with no separators, e.g. "0500000000".
    std::string sliceToHex(slice);
    std::ostream& dumpSlice(std::ostream&, slice);

    /// Parses hex digits into bytes; spaces are ignored. Makes test input more readable.
    std::vector<uint8_t> hexToBytes(const char *hex);
}

using namespace boson_test;

namespace boson {
    // to make slice work with Catch's logging. This has to be in the 'boson' namespace.
    static inline std::ostream& operator<< (std::ostream& o, slice s) {
        return dumpSlice(o, s);
    }
}

// Checks that `EXPR` throws a BosonException with the given error code.
#define CHECK_BOSON_ERROR(EXPR, CODE) \
    do { \
        try { \
            EXPR; \
            FAIL("Expected " #CODE " from " #EXPR); \
        } catch (const boson::BosonException &x_) { \
            CHECK(x_.code == (CODE)); \
        } \
    } while (0)

// This has to come last so that '<<' overrides can be used by Catch.
#include "catch.hpp"
