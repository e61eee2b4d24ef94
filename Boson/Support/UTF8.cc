//
// UTF8.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "UTF8.hh"

namespace boson {

    static constexpr const char* kReplacementChar = "\xEF\xBF\xBD";     // U+FFFD


    // Examines the character starting at `s[0]`. Returns the number of bytes in it if it's valid;
    // else returns 0 and sets `badLength` to the length of the maximal invalid subpart.
    __hot
    static size_t scanChar(const uint8_t *s, size_t avail, size_t &badLength) noexcept {
        uint8_t c = s[0];
        if (c < 0x80)
            return 1;

        size_t len;
        uint8_t lo = 0x80, hi = 0xBF;       // Allowed range of the 2nd byte
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0)
                lo = 0xA0;                  // no overlong forms
            else if (c == 0xED)
                hi = 0x9F;                  // no surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0)
                lo = 0x90;
            else if (c == 0xF4)
                hi = 0x8F;                  // nothing above U+10FFFF
        } else {
            badLength = 1;
            return 0;
        }

        for (size_t i = 1; i < len; ++i) {
            if (i >= avail) {
                badLength = i;
                return 0;
            }
            uint8_t b = s[i];
            uint8_t min = (i == 1) ? lo : 0x80, max = (i == 1) ? hi : 0xBF;
            if (b < min || b > max) {
                badLength = i;
                return 0;
            }
        }
        return len;
    }


    __hot
    size_t ValidUTF8Length(slice s) noexcept {
        const uint8_t *p = s.begin();
        size_t pos = 0, bad;
        while (pos < s.size) {
            size_t n = scanChar(p + pos, s.size - pos, bad);
            if (n == 0)
                break;
            pos += n;
        }
        return pos;
    }


    bool IsValidUTF8(slice s) noexcept {
        return ValidUTF8Length(s) == s.size;
    }


    std::string ReplaceInvalidUTF8(slice s) {
        std::string result;
        result.reserve(s.size);
        const uint8_t *p = s.begin();
        size_t pos = 0;
        while (pos < s.size) {
            size_t bad = 0;
            size_t n = scanChar(p + pos, s.size - pos, bad);
            if (n > 0) {
                result.append((const char*)p + pos, n);
                pos += n;
            } else {
                result.append(kReplacementChar);
                pos += bad;
            }
        }
        return result;
    }

}
