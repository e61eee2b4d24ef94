//
// Binary.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Binary.hh"
#include "BosonException.hh"
#include "betterassert.hh"
#include <algorithm>
#include <random>

namespace boson {

    Uuid Uuid::fromBytes(slice s) {
        precondition(s.size == kSize);
        Bytes b;
        s.copyTo(b.data());
        return Uuid(b);
    }


    Uuid Uuid::generate() {
        static thread_local std::mt19937_64 sRNG{std::random_device{}()};
        Bytes b;
        for (size_t i = 0; i < kSize; i += 8) {
            uint64_t r = sRNG();
            for (size_t j = 0; j < 8; ++j)
                b[i + j] = uint8_t(r >> (8 * j));
        }
        b[6] = (b[6] & 0x0F) | 0x40;       // version 4
        b[8] = (b[8] & 0x3F) | 0x80;       // RFC 4122 variant
        return Uuid(b);
    }


    Uuid Uuid::parse(slice str) {
        std::string digits;
        if (str.size == 36 && str[8] == '-' && str[13] == '-' && str[18] == '-' && str[23] == '-') {
            for (size_t i = 0; i < str.size; ++i)
                if (i != 8 && i != 13 && i != 18 && i != 23)
                    digits += char(str[i]);
        } else {
            digits = str.asString();
        }
        Bytes b;
        if (!decodeHex(slice(digits), b.data(), kSize))
            BosonException::_throw(InvalidHex, "not a UUID: \"%.*s\"", FMTSLICE(str));
        return Uuid(b);
    }


    std::string Uuid::toString() const {
        std::string hex = asSlice().hexString();
        return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-'
             + hex.substr(16, 4) + '-' + hex.substr(20);
    }


#pragma mark - BINARY:


    static BinarySubtype subtypeFor(UuidRepresentation rep) {
        return (rep == UuidRepresentation::Standard) ? BinarySubtype::Uuid
                                                     : BinarySubtype::UuidOld;
    }


    // Converts between the standard byte order and a legacy one. Each conversion is its own
    // inverse.
    static void reorder(Uuid::Bytes &b, UuidRepresentation rep) {
        switch (rep) {
            case UuidRepresentation::Standard:
            case UuidRepresentation::PythonLegacy:
                break;
            case UuidRepresentation::JavaLegacy:
                std::reverse(b.begin(), b.begin() + 8);
                std::reverse(b.begin() + 8, b.end());
                break;
            case UuidRepresentation::CSharpLegacy:
                std::reverse(b.begin(), b.begin() + 4);
                std::reverse(b.begin() + 4, b.begin() + 6);
                std::reverse(b.begin() + 6, b.begin() + 8);
                break;
        }
    }


    Binary Binary::fromUuid(const Uuid &uuid, UuidRepresentation rep) {
        Uuid::Bytes b = uuid.bytes();
        reorder(b, rep);
        return Binary(subtypeFor(rep), std::vector<uint8_t>(b.begin(), b.end()));
    }


    Uuid Binary::toUuid(UuidRepresentation rep) const {
        throwIf(subtype != subtypeFor(rep), InvalidUuidSubtype,
                "expected binary subtype %d, got %d",
                int(subtypeFor(rep)), int(subtype));
        throwIf(bytes.size() != Uuid::kSize, MalformedValue,
                "UUID must be 16 bytes, got %zu", bytes.size());
        Uuid::Bytes b;
        std::copy(bytes.begin(), bytes.end(), b.begin());
        reorder(b, rep);
        return Uuid(b);
    }

}
