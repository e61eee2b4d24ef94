//
// Endian.hh
//
// Copyright 2015-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "boson/PlatformCompat.hh"
#include <cstdint>
#include <string.h>

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    #define BOSON_BIG_ENDIAN 1
#endif

namespace boson { namespace endian {

    namespace internal {
#ifdef BOSON_BIG_ENDIAN
        BOSON_CONST inline uint16_t swapLittle(uint16_t n) noexcept {return __builtin_bswap16(n);}
        BOSON_CONST inline uint32_t swapLittle(uint32_t n) noexcept {return __builtin_bswap32(n);}
        BOSON_CONST inline uint64_t swapLittle(uint64_t n) noexcept {return __builtin_bswap64(n);}
#else
        BOSON_CONST inline uint16_t swapLittle(uint16_t n) noexcept {return n;}
        BOSON_CONST inline uint32_t swapLittle(uint32_t n) noexcept {return n;}
        BOSON_CONST inline uint64_t swapLittle(uint64_t n) noexcept {return n;}
#endif
        BOSON_CONST inline uint32_t swapBig(uint32_t n) noexcept {
#ifdef BOSON_BIG_ENDIAN
            return n;
#else
            return __builtin_bswap32(n);
#endif
        }

        template <class T> struct unsigned_of;
        template <> struct unsigned_of<int32_t>  {using type = uint32_t;};
        template <> struct unsigned_of<uint32_t> {using type = uint32_t;};
        template <> struct unsigned_of<int64_t>  {using type = uint64_t;};
        template <> struct unsigned_of<uint64_t> {using type = uint64_t;};
        template <> struct unsigned_of<double>   {using type = uint64_t;};
    }


    /** Reads a little-endian number from unaligned memory. */
    template <class T>
    inline T decodeLittle(const void *src) noexcept {
        using U = typename internal::unsigned_of<T>::type;
        U raw;
        memcpy(&raw, src, sizeof(raw));
        raw = internal::swapLittle(raw);
        T result;
        memcpy(&result, &raw, sizeof(result));
        return result;
    }

    /** Writes a number to unaligned memory in little-endian byte order. */
    template <class T>
    inline void encodeLittle(T value, void *dst) noexcept {
        using U = typename internal::unsigned_of<T>::type;
        U raw;
        memcpy(&raw, &value, sizeof(raw));
        raw = internal::swapLittle(raw);
        memcpy(dst, &raw, sizeof(raw));
    }

    /** Reads a big-endian 32-bit number from unaligned memory. */
    inline uint32_t decodeBig32(const void *src) noexcept {
        uint32_t raw;
        memcpy(&raw, src, sizeof(raw));
        return internal::swapBig(raw);
    }

    /** Writes a 32-bit number to unaligned memory in big-endian byte order. */
    inline void encodeBig32(uint32_t value, void *dst) noexcept {
        value = internal::swapBig(value);
        memcpy(dst, &value, sizeof(value));
    }

} }
