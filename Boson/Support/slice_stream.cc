//
// slice_stream.cc
//
// Copyright 2021-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "slice_stream.hh"

namespace boson {

    __hot slice slice_istream::readAll(size_t nBytes) noexcept {
        if (nBytes > size)
            return nullslice;
        slice result(buf, nBytes);
        skip(nBytes);
        return result;
    }


    __hot bool slice_istream::readAll(void *dstBuf, size_t dstSize) noexcept {
        if (dstSize > size)
            return false;
        ::memcpy(dstBuf, buf, dstSize);
        skip(dstSize);
        return true;
    }


    __hot slice slice_istream::readToDelimiter(uint8_t delim) noexcept {
        const uint8_t *found = findByte(delim);
        if (!found)
            return nullslice;
        slice result(buf, found);
        setStart(found + 1);
        return result;
    }


    __hot uint8_t slice_istream::readByte() noexcept {
        if (_usuallyFalse(size == 0))
            return 0;
        uint8_t result = (*this)[0];
        skip(1);
        return result;
    }


    bool slice_istream::readDigits(size_t nDigits, int &result) noexcept {
        if (nDigits > size)
            return false;
        int n = 0;
        for (size_t i = 0; i < nDigits; ++i) {
            uint8_t c = (*this)[i];
            if (c < '0' || c > '9')
                return false;
            n = 10 * n + (c - '0');
        }
        skip(nDigits);
        result = n;
        return true;
    }

}
