//
// SerdeHelpers.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "SerdeHelpers.hh"
#include <cinttypes>

namespace boson {
    using namespace std;


#pragma mark - INTEGERS:


    void serializeU32AsI32(uint32_t value, Serializer &s) {
        auto i = ExactIntCast<int32_t>(value);
        if (!i)
            BosonException::_throw(LossyConversion, "cannot convert u32 %" PRIu32 " to i32", value);
        s.writeInt32(*i);
    }

    void serializeU32AsI64(uint32_t value, Serializer &s) {
        s.writeInt64(int64_t(value));
    }

    void serializeU64AsI32(uint64_t value, Serializer &s) {
        auto i = ExactIntCast<int32_t>(value);
        if (!i)
            BosonException::_throw(LossyConversion, "cannot convert u64 %" PRIu64 " to i32", value);
        s.writeInt32(*i);
    }

    void serializeU64AsI64(uint64_t value, Serializer &s) {
        auto i = ExactIntCast<int64_t>(value);
        if (!i)
            BosonException::_throw(LossyConversion, "cannot convert u64 %" PRIu64 " to i64", value);
        s.writeInt64(*i);
    }


#pragma mark - DOUBLES:


    void U32AsF64::serialize(uint32_t value, Serializer &s) {
        s.writeDouble(double(value));
    }

    uint32_t U32AsF64::deserialize(Deserializer &d) {
        double f = d.readDouble();
        auto result = ExactUInt32(f);
        if (!result)
            BosonException::_throw(LossyConversion, "cannot convert f64 %.17g to u32", f);
        return *result;
    }


    void U64AsF64::serialize(uint64_t value, Serializer &s) {
        auto f = ExactDouble(value);
        if (!f)
            BosonException::_throw(LossyConversion, "cannot convert u64 %" PRIu64 " to f64", value);
        s.writeDouble(*f);
    }

    uint64_t U64AsF64::deserialize(Deserializer &d) {
        double f = d.readDouble();
        auto result = ExactUInt64(f);
        if (!result)
            BosonException::_throw(LossyConversion, "cannot convert f64 %.17g to u64", f);
        return *result;
    }


#pragma mark - TIMESTAMPS:


    void U32AsTimestamp::serialize(uint32_t value, Serializer &s) {
        s.writeTimestamp(Timestamp{value, 0});
    }

    uint32_t U32AsTimestamp::deserialize(Deserializer &d) {
        return d.readTimestamp().time;
    }


    void TimestampAsU32::serialize(Timestamp ts, Serializer &s) {
        if (ts.increment != 0)
            BosonException::_throw(LossyConversion,
                                   "cannot convert Timestamp with a non-zero increment to u32");
        s.write(ts.time);
    }

    Timestamp TimestampAsU32::deserialize(Deserializer &d) {
        return Timestamp{d.read<uint32_t>(), 0};
    }


#pragma mark - OBJECTID:


    void ObjectIdAsHexString::serialize(const ObjectId &oid, Serializer &s) {
        s.writeString(oid.toHex());
    }

    ObjectId ObjectIdAsHexString::deserialize(Deserializer &d) {
        return ObjectId::parse(d.readString());
    }


    void HexStringAsObjectId::serialize(const string &hex, Serializer &s) {
        s.writeObjectId(ObjectId::parse(hex));
    }

    string HexStringAsObjectId::deserialize(Deserializer &d) {
        return d.readObjectId().toHex();
    }


#pragma mark - DATETIME:


    void DateTimeAsRfc3339String::serialize(DateTime date, Serializer &s) {
        s.writeString(date.toRfc3339());
    }

    DateTime DateTimeAsRfc3339String::deserialize(Deserializer &d) {
        return DateTime::parseRfc3339(d.readString());
    }


    void Rfc3339StringAsDateTime::serialize(const string &str, Serializer &s) {
        s.writeDateTime(DateTime::parseRfc3339(str));
    }

    string Rfc3339StringAsDateTime::deserialize(Deserializer &d) {
        return d.readDateTime().toRfc3339();
    }


    void I64AsDateTime::serialize(int64_t millis, Serializer &s) {
        s.writeDateTime(DateTime::fromMillis(millis));
    }

    int64_t I64AsDateTime::deserialize(Deserializer &d) {
        return d.readDateTime().timestampMillis();
    }

}
