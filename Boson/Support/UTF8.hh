//
// UTF8.hh
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "boson/slice.hh"
#include <string>

namespace boson {

    /** Returns true if `s` is well-formed UTF-8 (RFC 3629: no overlong forms, no surrogates,
        nothing above U+10FFFF.) */
    bool IsValidUTF8(slice s) noexcept BOSON_PURE;

    /** Returns the length of the longest valid UTF-8 prefix of `s`. */
    size_t ValidUTF8Length(slice s) noexcept BOSON_PURE;

    /** Copies `s` to a string, replacing each maximal invalid subsequence with U+FFFD. */
    std::string ReplaceInvalidUTF8(slice s);

}
