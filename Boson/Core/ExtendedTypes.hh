//
// ExtendedTypes.hh
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
#include "ObjectId.hh"
#include "boson/slice.hh"
#include <algorithm>
#include <array>
#include <string>
#include <tuple>

namespace boson {

    /** An internal replication timestamp. The increment is an ordinal within the second.
        Ordered as the pair (time, increment). On the wire the increment comes first. */
    struct Timestamp {
        uint32_t time {0};
        uint32_t increment {0};

        bool operator== (const Timestamp &t) const noexcept {return time == t.time && increment == t.increment;}
        bool operator!= (const Timestamp &t) const noexcept {return !(*this == t);}
        bool operator< (const Timestamp &t) const noexcept {
            return std::tie(time, increment) < std::tie(t.time, t.increment);
        }
    };


    /** A regular expression. Neither the pattern nor the options may contain a NUL byte;
        that's checked when it's encoded. */
    struct Regex {
        std::string pattern;
        std::string options;        // Always kept in sorted order

        Regex() = default;
        Regex(std::string pat, std::string opts)
        :pattern(std::move(pat)), options(std::move(opts))
        {
            std::sort(options.begin(), options.end());
        }

        bool operator== (const Regex &r) const noexcept {return pattern == r.pattern && options == r.options;}
        bool operator!= (const Regex &r) const noexcept {return !(*this == r);}
    };


    /** JavaScript code. */
    struct JavaScriptCode {
        std::string code;

        bool operator== (const JavaScriptCode &c) const noexcept {return code == c.code;}
        bool operator!= (const JavaScriptCode &c) const noexcept {return code != c.code;}
    };


    /** A symbol (deprecated in BSON, but still readable.) */
    struct Symbol {
        std::string symbol;

        bool operator== (const Symbol &s) const noexcept {return symbol == s.symbol;}
        bool operator!= (const Symbol &s) const noexcept {return symbol != s.symbol;}
    };


    /** A database pointer (deprecated): a namespace string and an ObjectId. */
    struct DbPointer {
        std::string namespace_;
        ObjectId    id;

        bool operator== (const DbPointer &p) const noexcept {return namespace_ == p.namespace_ && id == p.id;}
        bool operator!= (const DbPointer &p) const noexcept {return !(*this == p);}
    };


    /** An IEEE 754-2008 128-bit decimal, kept as its 16 little-endian bytes. */
    struct Decimal128 {
        static constexpr size_t kSize = 16;
        std::array<uint8_t, kSize> bytes {};

        /// Copies the 16 bytes at `src`.
        static Decimal128 fromBytes(const void *src) noexcept {
            Decimal128 d;
            memcpy(d.bytes.data(), src, kSize);
            return d;
        }
        slice asSlice() const noexcept                  {return {bytes.data(), kSize};}

        bool operator== (const Decimal128 &d) const noexcept {return bytes == d.bytes;}
        bool operator!= (const Decimal128 &d) const noexcept {return bytes != d.bytes;}
    };


    // Value-less types:

    struct Null       { bool operator== (Null) const noexcept {return true;}
                        bool operator!= (Null) const noexcept {return false;} };
    struct Undefined  { bool operator== (Undefined) const noexcept {return true;}
                        bool operator!= (Undefined) const noexcept {return false;} };
    struct MinKey     { bool operator== (MinKey) const noexcept {return true;}
                        bool operator!= (MinKey) const noexcept {return false;} };
    struct MaxKey     { bool operator== (MaxKey) const noexcept {return true;}
                        bool operator!= (MaxKey) const noexcept {return false;} };

}
