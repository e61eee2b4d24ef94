//
// Binary.hh
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
#include "BSONSpec.hh"
#include "boson/slice.hh"
#include <array>
#include <string>
#include <vector>

namespace boson {

    /** A 16-byte universally unique identifier. */
    class Uuid {
    public:
        static constexpr size_t kSize = 16;
        using Bytes = std::array<uint8_t, kSize>;

        constexpr Uuid() noexcept                       :_bytes{} { }
        explicit constexpr Uuid(const Bytes &b) noexcept :_bytes(b) { }

        /// Constructs a Uuid from exactly 16 bytes.
        static Uuid fromBytes(slice);

        /// Generates a random (version 4) Uuid.
        static Uuid generate();

        /// Parses 32 hex digits, optionally in the hyphenated 8-4-4-4-12 form.
        /// Throws `InvalidHex` if it's malformed.
        static Uuid parse(slice);

        /// Returns the lowercase hyphenated form, e.g. "00112233-4455-6677-8899-aabbccddeeff".
        std::string toString() const;

        const Bytes& bytes() const noexcept             {return _bytes;}
        slice asSlice() const noexcept                  {return {_bytes.data(), kSize};}

        bool operator== (const Uuid &u) const noexcept  {return _bytes == u._bytes;}
        bool operator!= (const Uuid &u) const noexcept  {return _bytes != u._bytes;}

    private:
        Bytes _bytes;
    };


    /** The byte orderings historically used by different drivers to store a Uuid as binary.
        `Standard` uses subtype 4; the legacy ones use subtype 3. */
    enum class UuidRepresentation {
        Standard,
        CSharpLegacy,       // First three groups little-endian
        JavaLegacy,         // Each 8-byte half reversed
        PythonLegacy,       // Same byte order as Standard, but subtype 3
    };


    /** Binary data with a subtype. */
    struct Binary {
        BinarySubtype        subtype {BinarySubtype::Generic};
        std::vector<uint8_t> bytes;

        Binary() = default;
        Binary(BinarySubtype st, std::vector<uint8_t> b)   :subtype(st), bytes(std::move(b)) { }
        Binary(BinarySubtype st, slice b)                  :subtype(st), bytes(b.asBytes()) { }

        /// Encodes a Uuid using the given representation.
        static Binary fromUuid(const Uuid&, UuidRepresentation =UuidRepresentation::Standard);

        /// Decodes a Uuid stored with the given representation. Throws `InvalidUuidSubtype` if
        /// the subtype doesn't match the representation, or `MalformedValue` if the data isn't
        /// 16 bytes long.
        Uuid toUuid(UuidRepresentation =UuidRepresentation::Standard) const;

        slice asSlice() const noexcept                     {return slice(bytes);}

        bool operator== (const Binary &b) const noexcept {
            return subtype == b.subtype && bytes == b.bytes;
        }
        bool operator!= (const Binary &b) const noexcept   {return !(*this == b);}
    };

}
