//
// slice_stream.hh
//
// Copyright 2021-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "boson/slice.hh"

namespace boson {

    /** A simple stream that reads from memory using a slice to keep track of the available bytes.
        It remembers where it started, so `position()` gives the offset of the next byte. */
    struct slice_istream : public slice {
        constexpr slice_istream(slice s) noexcept          :slice(s), _start(s.buf) { }
        slice_istream(slice_istream&&) = default;

        /// The number of bytes remaining to be read.
        size_t bytesRemaining() const noexcept BOSON_PURE      {return size;}

        /// Returns true when there's no more data to read.
        bool eof() const noexcept BOSON_PURE                   {return size == 0;}

        /// The offset of the next byte to be read, relative to the start of the stream.
        size_t position() const noexcept BOSON_PURE            {return size_t(pointerDiff(buf, _start));}

        /// Reads _exactly_ `nBytes` bytes and returns them as a \ref slice.
        /// If not enough bytes are available, returns `nullslice` and doesn't advance.
        slice readAll(size_t nBytes) noexcept;

        /// Copies _exactly_ `dstSize` bytes to `dstBuf` and returns true.
        /// If not enough bytes are available, copies nothing and returns false.
        [[nodiscard]] bool readAll(void *dstBuf, size_t dstSize) noexcept;

        /// Searches for the byte `delim`. If found, returns all the data before it and moves the
        /// stream position past it. If not found, returns `nullslice` and does not advance.
        slice readToDelimiter(uint8_t delim) noexcept;

        /// Reads the next byte. If the stream is already at EOF, returns 0.
        uint8_t readByte() noexcept;

        /// Returns the next byte, or 0 if at EOF, but does not advance the stream.
        uint8_t peekByte() const noexcept BOSON_PURE          {return (size > 0) ? (*this)[0] : 0;}

        /// Advances past `n` bytes without doing anything with them.
        void skip(size_t n) noexcept                           {slice::moveStart(ptrdiff_t(n));}

        /// Reads exactly `nDigits` ASCII decimal digits and stores their value in `result`.
        /// Returns false, without advancing, if fewer digits are available.
        [[nodiscard]] bool readDigits(size_t nDigits, int &result) noexcept;

    private:
        // Passing a `slice_istream` by value would make the callee's reads invisible to the
        // caller. Always pass a reference, `slice_istream&`.
        slice_istream(const slice_istream&) = delete;

        const void* _start;
    };

}
