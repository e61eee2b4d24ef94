//
// slice.cc
//
// Copyright 2015-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "boson/slice.hh"

namespace boson {

    __hot int slice::compare(slice b) const noexcept {
        size_t minSize = std::min(size, b.size);
        int result = minSize ? memcmp(buf, b.buf, minSize) : 0;
        if (result != 0 || size == b.size)
            return result;
        return (size < b.size) ? -1 : 1;
    }


    bool slice::hasPrefix(slice s) const noexcept {
        return s.size > 0 && size >= s.size && ::memcmp(buf, s.buf, s.size) == 0;
    }


    static inline char _hexDigit(int n) {
        static constexpr const char kDigits[] = "0123456789abcdef";
        return kDigits[n];
    }


    std::string slice::hexString() const {
        std::string result;
        result.reserve(2 * size);
        for (uint8_t byte : *this) {
            result += _hexDigit(byte >> 4);
            result += _hexDigit(byte & 0x0F);
        }
        return result;
    }


    BOSON_CONST static int _digittoint(char ch) noexcept {
        if (ch >= '0' && ch <= '9')
            return ch - '0';
        else if (ch >= 'a' && ch <= 'f')
            return ch - 'a' + 10;
        else if (ch >= 'A' && ch <= 'F')
            return ch - 'A' + 10;
        return -1;
    }


    bool decodeHex(slice hex, uint8_t *out, size_t outSize) noexcept {
        if (hex.size != 2 * outSize)
            return false;
        for (size_t i = 0; i < outSize; ++i) {
            int hi = _digittoint(char(hex[2*i])), lo = _digittoint(char(hex[2*i + 1]));
            if (hi < 0 || lo < 0)
                return false;
            out[i] = uint8_t((hi << 4) | lo);
        }
        return true;
    }

}
