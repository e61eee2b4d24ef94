//
// ObjectId.hh
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
#include <array>
#include <string>

namespace boson {

    /** A 12-byte object identifier: a 4-byte big-endian timestamp (seconds since the epoch),
        a 5-byte per-process random value, and a 3-byte big-endian counter. */
    class ObjectId {
    public:
        static constexpr size_t kSize = 12;
        using Bytes = std::array<uint8_t, kSize>;

        /// Constructs an all-zero ObjectId.
        constexpr ObjectId() noexcept                   :_bytes{} { }
        explicit constexpr ObjectId(const Bytes &b) noexcept :_bytes(b) { }

        /// Constructs an ObjectId from exactly 12 bytes.
        static ObjectId fromBytes(slice);

        /// Generates a new, unique ObjectId. Thread-safe.
        static ObjectId generate();

        /// Parses a 24-digit hex string. Throws `InvalidHex` if it's malformed.
        static ObjectId parse(slice hex);

        /// Returns the 24-digit lowercase hex representation.
        std::string toHex() const                       {return asSlice().hexString();}

        /// The creation time, in seconds since 1/1/1970.
        uint32_t timestamp() const noexcept BOSON_PURE;

        const Bytes& bytes() const noexcept             {return _bytes;}
        slice asSlice() const noexcept                  {return {_bytes.data(), kSize};}

        bool operator== (const ObjectId &o) const noexcept {return _bytes == o._bytes;}
        bool operator!= (const ObjectId &o) const noexcept {return _bytes != o._bytes;}
        bool operator< (const ObjectId &o) const noexcept  {return _bytes < o._bytes;}

    private:
        Bytes _bytes;
    };

}
