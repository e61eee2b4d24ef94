//
// slice.hh
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#ifndef _BOSON_SLICE_HH
#define _BOSON_SLICE_HH

#include "boson/Base.h"
#include <algorithm>            // for std::min()
#include <cstdint>
#include <stddef.h>
#include <string.h>             // for memcpy(), memcmp()
#include <string>
#include <string_view>
#include <vector>


// Utility for using slice with printf-style formatting.
// Use "%.*s" in the format string; then for the corresponding argument put FMTSLICE(theslice).
// NOTE: The argument S will be evaluated twice.
#define FMTSLICE(S)    (int)(S).size, (const char*)(S).buf


namespace boson {

    /** Adds a byte offset to a pointer. */
    template <typename T>
    BOSON_CONST constexpr inline const T* offsetby(const T *t, ptrdiff_t offset) noexcept {
        return (const T*)((const uint8_t*)t + offset);
    }

    /** Subtracts the 2nd pointer from the 1st, returning the difference in addresses. */
    BOSON_CONST constexpr inline ptrdiff_t pointerDiff(const void* a, const void* b) noexcept {
        return (const uint8_t*)a - (const uint8_t*)b;
    }


    /** A simple pointer to a range of memory: `size` bytes starting at address `buf`.

        * `buf` may be NULL, but only if `size` is zero; this is called `nullslice`.
        * `size` may be zero with a non-NULL `buf`; that's called an "empty slice".
        * **No ownership is implied!** Just like a regular pointer, it's the client's responsibility
          to ensure the memory buffer remains valid. Every BSON view in this library is a slice
          over memory owned by someone else.
        * The memory pointed to cannot be modified through this class. */
    struct slice {
        const void* buf {nullptr};
        size_t      size {0};

        constexpr slice() noexcept STEPOVER                             { }
        constexpr slice(std::nullptr_t) noexcept STEPOVER               { }
        constexpr slice(const void* b, size_t s) noexcept STEPOVER      :buf(b), size(s) { }
        slice(const void* start, const void* end) noexcept STEPOVER
                                        :slice(start, size_t(pointerDiff(end, start))) { }
        slice(const char *cstr) noexcept STEPOVER   :slice(cstr, cstr ? strlen(cstr) : 0) { }
        slice(const std::string &str) noexcept STEPOVER     :slice(str.data(), str.size()) { }
        constexpr slice(std::string_view str) noexcept STEPOVER :slice(str.data(), str.size()) { }
        slice(const std::vector<uint8_t> &v) noexcept STEPOVER  :slice(v.data(), v.size()) { }

        /// True if the slice's length is zero.
        bool empty() const noexcept BOSON_PURE                      {return size == 0;}

        /// Testing a slice as a bool results in false for nullslice, true for anything else.
        explicit operator bool() const noexcept BOSON_PURE          {return buf != nullptr;}

        // These methods allow iterating a slice's bytes with a `for(:)` loop:
        const uint8_t* begin() const noexcept BOSON_PURE            {return (const uint8_t*)buf;}
        const uint8_t* end() const noexcept BOSON_PURE              {return begin() + size;}

        const uint8_t& operator[](size_t i) const noexcept BOSON_PURE   {return begin()[i];}

        /// Returns the sub-slice of `n` bytes starting at offset `i`.
        slice operator()(size_t i, size_t n) const noexcept BOSON_PURE  {return {begin() + i, n};}

        slice upTo(const void* pos) const noexcept BOSON_PURE       {return slice(buf, pos);}
        slice from(const void* pos) const noexcept BOSON_PURE       {return slice(pos, end());}
        slice upTo(size_t offset) const noexcept BOSON_PURE         {return slice(buf, offset);}
        slice from(size_t offset) const noexcept BOSON_PURE {return slice(begin() + offset, size - offset);}

        size_t offsetOf(const void* ptr) const noexcept BOSON_PURE {return size_t(pointerDiff(ptr, buf));}

        /// Returns a pointer to the first occurrence of `b`, or nullptr.
        const uint8_t* findByte(uint8_t b) const noexcept BOSON_PURE {
            if (_usuallyFalse(size == 0))
                return nullptr;
            return (const uint8_t*)::memchr(buf, b, size);
        }

        int compare(slice) const noexcept BOSON_PURE;

        bool operator==(const slice &s) const noexcept BOSON_PURE {
            return size == s.size && (size == 0 || memcmp(buf, s.buf, size) == 0);
        }
        bool operator!=(const slice &s) const noexcept BOSON_PURE  {return !(*this == s);}
        bool operator<(slice s) const noexcept BOSON_PURE          {return compare(s) < 0;}

        bool hasPrefix(slice) const noexcept BOSON_PURE;

        // Mutators; these change the range, not the memory it points to:
        void setStart(const void *s) noexcept           {size = size_t(pointerDiff(end(), s)); buf = s;}
        void setEnd(const void *e) noexcept             {size = size_t(pointerDiff(e, buf));}
        void moveStart(ptrdiff_t delta) noexcept        {buf = begin() + delta; size -= delta;}
        void shorten(size_t s) noexcept                 {size = std::min(size, s);}

        /// Copies my contents to memory starting at `dst`, using `memcpy`.
        void copyTo(void *dst) const noexcept           {if (size > 0) ::memcpy(dst, buf, size);}

        // Conversions:

        explicit operator std::string() const           {return std::string((const char*)buf, size);}
        std::string asString() const                    {return (std::string)*this;}
        std::string_view asStringView() const noexcept  {return {(const char*)buf, size};}
        std::vector<uint8_t> asBytes() const            {return {begin(), end()};}

        /// Returns the contents as lowercase hexadecimal digits.
        std::string hexString() const;
    };


    /// A slice representing no data, with a NULL `buf`.
    constexpr slice nullslice;


    /** Decodes `hex` (which must contain exactly `2*outSize` hex digits) into `out`.
        Returns false, leaving `out` in an unspecified state, if any character isn't a hex digit
        or the length is wrong. */
    bool decodeHex(slice hex, uint8_t *out, size_t outSize) noexcept;


    inline namespace literals {
        /// Literal syntax for slices: `"foo"_sl`
        inline constexpr slice operator "" _sl (const char *str, size_t length) noexcept {
            return slice(str, length);
        }
    }

}

#endif // _BOSON_SLICE_HH
