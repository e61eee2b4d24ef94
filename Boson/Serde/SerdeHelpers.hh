//
// SerdeHelpers.hh
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
#include "Serde.hh"

/*  Alternative representations of fields. Each helper has a static `serialize(value, Serializer&)`
    and `deserialize(Deserializer&)`, to be passed to \ref Serializer::writeField and
    \ref Deserializer::readWith:

        s.writeField("count", count, U64AsF64::serialize);
        count = d.readWith(U64AsF64::deserialize);

    Conversions that can't be done exactly throw `LossyConversion`. */

namespace boson {

    /// Writes a uint32 as an Int32; fails if it exceeds INT32_MAX.
    void serializeU32AsI32(uint32_t, Serializer&);

    /// Writes a uint32 as an Int64.
    void serializeU32AsI64(uint32_t, Serializer&);

    /// Writes a uint64 as an Int32; fails if it exceeds INT32_MAX.
    void serializeU64AsI32(uint64_t, Serializer&);

    /// Writes a uint64 as an Int64; fails if it exceeds INT64_MAX.
    void serializeU64AsI64(uint64_t, Serializer&);


    /// A uint32 stored as a Double. Reading fails unless the double is (within epsilon of)
    /// an integer in range.
    struct U32AsF64 {
        static void serialize(uint32_t, Serializer&);
        static uint32_t deserialize(Deserializer&);
    };

    /// A uint64 stored as a Double. Writing fails if the double can't represent the value
    /// exactly, i.e. above 2^53 unless the low bits are zero.
    struct U64AsF64 {
        static void serialize(uint64_t, Serializer&);
        static uint64_t deserialize(Deserializer&);
    };


    /// A uint32 stored as a Timestamp's time, with an increment of 0.
    struct U32AsTimestamp {
        static void serialize(uint32_t, Serializer&);
        static uint32_t deserialize(Deserializer&);
    };

    /// A Timestamp stored as an integer time. Writing fails if the increment isn't 0.
    struct TimestampAsU32 {
        static void serialize(Timestamp, Serializer&);
        static Timestamp deserialize(Deserializer&);
    };


    /// An ObjectId stored as a 24-digit hex string.
    struct ObjectIdAsHexString {
        static void serialize(const ObjectId&, Serializer&);
        static ObjectId deserialize(Deserializer&);
    };

    /// A hex string stored as an ObjectId. Writing fails with `InvalidHex` if it isn't valid.
    struct HexStringAsObjectId {
        static void serialize(const std::string&, Serializer&);
        static std::string deserialize(Deserializer&);
    };


    /// A DateTime stored as an RFC 3339 string.
    struct DateTimeAsRfc3339String {
        static void serialize(DateTime, Serializer&);
        static DateTime deserialize(Deserializer&);
    };

    /// An RFC 3339 string stored as a DateTime.
    struct Rfc3339StringAsDateTime {
        static void serialize(const std::string&, Serializer&);
        static std::string deserialize(Deserializer&);
    };

    /// An int64 count of milliseconds since the epoch, stored as a DateTime.
    struct I64AsDateTime {
        static void serialize(int64_t, Serializer&);
        static int64_t deserialize(Deserializer&);
    };


    /// A Uuid stored as Binary with a particular byte ordering and subtype.
    template <UuidRepresentation Rep>
    struct UuidAsBinaryRepresentation {
        static void serialize(const Uuid &uuid, Serializer &s) {
            Binary bin = Binary::fromUuid(uuid, Rep);
            s.writeBinary(bin.subtype, bin.asSlice());
        }
        static Uuid deserialize(Deserializer &d) {
            return d.readBinary().toUuid(Rep);
        }
    };

    using UuidAsBinary             = UuidAsBinaryRepresentation<UuidRepresentation::Standard>;
    using UuidAsJavaLegacyBinary   = UuidAsBinaryRepresentation<UuidRepresentation::JavaLegacy>;
    using UuidAsPythonLegacyBinary = UuidAsBinaryRepresentation<UuidRepresentation::PythonLegacy>;
    using UuidAsCSharpLegacyBinary = UuidAsBinaryRepresentation<UuidRepresentation::CSharpLegacy>;

}
