//
// BosonTests.cc
//
// Copyright 2015-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "BosonTests.hh"
#include <cctype>
#include <stdexcept>


namespace boson_test {
    using namespace boson;

    std::string sliceToHex(slice result) {
        std::string hex;
        constexpr size_t bufSize = 4;
        for (size_t i = 0; i < result.size; i++) {
            char str[bufSize];
            snprintf(str, bufSize, "%02X", result[i]);
            hex.append(str);
        }
        return hex;
    }


    std::ostream& dumpSlice(std::ostream& o, slice s) {
        o << "slice[";
        if (s.buf == nullptr)
            return o << "null]";
        auto buf = (const uint8_t*)s.buf;
        for (size_t i = 0; i < s.size; i++) {
            if (buf[i] < 32 || buf[i] > 126)
                return o << sliceToHex(s) << "]";
        }
        return o << "\"" << std::string((char*)s.buf, s.size) << "\"]";
    }


    std::vector<uint8_t> hexToBytes(const char *hex) {
        std::vector<uint8_t> bytes;
        int hi = -1;
        for (const char *c = hex; *c; ++c) {
            if (*c == ' ')
                continue;
            if (!isxdigit((unsigned char)*c))
                throw std::invalid_argument("bad hex digit in test data");
            int digit = isdigit((unsigned char)*c) ? (*c - '0') : (tolower(*c) - 'a' + 10);
            if (hi < 0) {
                hi = digit;
            } else {
                bytes.push_back(uint8_t(hi << 4 | digit));
                hi = -1;
            }
        }
        if (hi >= 0)
            throw std::invalid_argument("odd number of hex digits in test data");
        return bytes;
    }

}
