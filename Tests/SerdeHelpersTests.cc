//
// SerdeHelpersTests.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "BosonTests.hh"
#include "SerdeHelpers.hh"

using namespace std;


// Serializes `value` as the field "v" of a document, using helper function `fn`.
template <class T, class Fn>
static Document writeWith(const T &value, Fn fn) {
    BsonSerializer s;
    s.beginDocument();
    s.writeField("v", value, fn);
    s.endDocument();
    return s.finish().as<Document>();
}

// Deserializes the field "v" of a document using helper function `fn`.
template <class Fn>
static auto readWith(const Document &doc, Fn fn) {
    Bson field = *doc.get("v");
    BsonDeserializer d(field);
    return d.readWith(fn);
}


TEST_CASE("Unsigned to signed integers", "[SerdeHelpers]") {
    CHECK(*writeWith(uint32_t(7), serializeU32AsI32).get("v") == Bson(int32_t(7)));
    CHECK_BOSON_ERROR(writeWith(UINT32_MAX, serializeU32AsI32), LossyConversion);

    CHECK(*writeWith(UINT32_MAX, serializeU32AsI64).get("v") == Bson(int64_t(UINT32_MAX)));

    CHECK(*writeWith(uint64_t(INT32_MAX), serializeU64AsI32).get("v") == Bson(int32_t(INT32_MAX)));
    CHECK_BOSON_ERROR(writeWith(uint64_t(INT32_MAX) + 1, serializeU64AsI32), LossyConversion);

    CHECK(*writeWith(uint64_t(INT64_MAX), serializeU64AsI64).get("v") == Bson(int64_t(INT64_MAX)));
    CHECK_BOSON_ERROR(writeWith(uint64_t(INT64_MAX) + 1, serializeU64AsI64), LossyConversion);
}


TEST_CASE("Unsigned integers as doubles", "[SerdeHelpers]") {
    SECTION("u32") {
        Document doc = writeWith(UINT32_MAX, U32AsF64::serialize);
        CHECK(doc.getDouble("v") == 4294967295.0);
        CHECK(readWith(doc, U32AsF64::deserialize) == UINT32_MAX);

        CHECK_BOSON_ERROR(readWith(Document{{"v", 1.5}}, U32AsF64::deserialize), LossyConversion);
        CHECK_BOSON_ERROR(readWith(Document{{"v", -1.0}}, U32AsF64::deserialize), LossyConversion);
        CHECK_BOSON_ERROR(readWith(Document{{"v", 4294967296.0}}, U32AsF64::deserialize),
                          LossyConversion);
        CHECK(readWith(Document{{"v", int32_t(12)}}, U32AsF64::deserialize) == 12);
    }
    SECTION("u64") {
        const uint64_t twoTo53 = uint64_t(1) << 53;
        Document doc = writeWith(twoTo53, U64AsF64::serialize);
        CHECK(doc.getDouble("v") == 9007199254740992.0);
        CHECK(readWith(doc, U64AsF64::deserialize) == twoTo53);

        CHECK_BOSON_ERROR(writeWith(twoTo53 + 1, U64AsF64::serialize), LossyConversion);
        CHECK_BOSON_ERROR(writeWith(UINT64_MAX, U64AsF64::serialize), LossyConversion);
        CHECK_BOSON_ERROR(writeWith(UINT64_MAX - 255, U64AsF64::serialize), LossyConversion);

        // Large values with zeros in the low bits are exact:
        CHECK(writeWith(uint64_t(1) << 60, U64AsF64::serialize).getDouble("v") == 1152921504606846976.0);

        CHECK_BOSON_ERROR(readWith(Document{{"v", 0.25}}, U64AsF64::deserialize), LossyConversion);
        CHECK_BOSON_ERROR(readWith(Document{{"v", 18446744073709551616.0}}, U64AsF64::deserialize),
                          LossyConversion);
    }
}


TEST_CASE("Timestamp helpers", "[SerdeHelpers]") {
    Document doc = writeWith(uint32_t(1234), U32AsTimestamp::serialize);
    CHECK(doc.getTimestamp("v") == Timestamp{1234, 0});
    CHECK(readWith(doc, U32AsTimestamp::deserialize) == 1234);
    // The increment is ignored when reading:
    CHECK(readWith(Document{{"v", Timestamp{5, 6}}}, U32AsTimestamp::deserialize) == 5);

    Document num = writeWith(Timestamp{99, 0}, TimestampAsU32::serialize);
    CHECK(*num.get("v") == Bson(int32_t(99)));
    CHECK(readWith(num, TimestampAsU32::deserialize) == Timestamp{99, 0});
    CHECK(*writeWith(Timestamp{UINT32_MAX, 0}, TimestampAsU32::serialize).get("v")
          == Bson(int64_t(UINT32_MAX)));
    CHECK_BOSON_ERROR(writeWith(Timestamp{99, 1}, TimestampAsU32::serialize), LossyConversion);
}


TEST_CASE("ObjectId helpers", "[SerdeHelpers]") {
    const string hex = "5f1a2b3c4d5e6f7081920304";
    ObjectId oid = ObjectId::parse(hex);

    Document asString = writeWith(oid, ObjectIdAsHexString::serialize);
    CHECK(asString.getStr("v") == hex);
    CHECK(readWith(asString, ObjectIdAsHexString::deserialize) == oid);

    Document asOid = writeWith(hex, HexStringAsObjectId::serialize);
    CHECK(asOid.getObjectId("v") == oid);
    CHECK(readWith(asOid, HexStringAsObjectId::deserialize) == hex);

    CHECK_BOSON_ERROR(writeWith(string("not hex"), HexStringAsObjectId::serialize), InvalidHex);
    CHECK_BOSON_ERROR(readWith(Document{{"v", "12345"}}, ObjectIdAsHexString::deserialize),
                      InvalidHex);
}


TEST_CASE("DateTime helpers", "[SerdeHelpers]") {
    DateTime date = DateTime::fromMillis(851042397000);

    Document asString = writeWith(date, DateTimeAsRfc3339String::serialize);
    CHECK(asString.getStr("v") == "1996-12-20T00:39:57Z");
    CHECK(readWith(asString, DateTimeAsRfc3339String::deserialize) == date);

    Document asDate = writeWith(string("1996-12-20T00:39:57Z"), Rfc3339StringAsDateTime::serialize);
    CHECK(asDate.getDateTime("v") == date);
    CHECK(readWith(asDate, Rfc3339StringAsDateTime::deserialize) == "1996-12-20T00:39:57Z");

    CHECK_BOSON_ERROR(writeWith(string("yesterday"), Rfc3339StringAsDateTime::serialize),
                      InvalidDateString);
    CHECK_BOSON_ERROR(writeWith(DateTime::kMax, DateTimeAsRfc3339String::serialize),
                      DateTimeRange);

    Document millis = writeWith(int64_t(-5), I64AsDateTime::serialize);
    CHECK(millis.getDateTime("v").timestampMillis() == -5);
    CHECK(readWith(millis, I64AsDateTime::deserialize) == -5);
}


TEST_CASE("Uuid binary representations", "[SerdeHelpers]") {
    Uuid uuid = Uuid::parse("00112233-4455-6677-8899-aabbccddeeff");

    Document standard = writeWith(uuid, UuidAsBinary::serialize);
    CHECK(standard.getBinary("v").subtype == BinarySubtype::Uuid);
    CHECK(sliceToHex(standard.getBinary("v").asSlice()) == "00112233445566778899AABBCCDDEEFF");
    CHECK(readWith(standard, UuidAsBinary::deserialize) == uuid);

    Document java = writeWith(uuid, UuidAsJavaLegacyBinary::serialize);
    CHECK(java.getBinary("v").subtype == BinarySubtype::UuidOld);
    CHECK(sliceToHex(java.getBinary("v").asSlice()) == "7766554433221100FFEEDDCCBBAA9988");
    CHECK(readWith(java, UuidAsJavaLegacyBinary::deserialize) == uuid);

    Document python = writeWith(uuid, UuidAsPythonLegacyBinary::serialize);
    CHECK(python.getBinary("v").subtype == BinarySubtype::UuidOld);
    CHECK(sliceToHex(python.getBinary("v").asSlice()) == "00112233445566778899AABBCCDDEEFF");
    CHECK(readWith(python, UuidAsPythonLegacyBinary::deserialize) == uuid);

    Document csharp = writeWith(uuid, UuidAsCSharpLegacyBinary::serialize);
    CHECK(csharp.getBinary("v").subtype == BinarySubtype::UuidOld);
    CHECK(sliceToHex(csharp.getBinary("v").asSlice()) == "33221100554477668899AABBCCDDEEFF");
    CHECK(readWith(csharp, UuidAsCSharpLegacyBinary::deserialize) == uuid);

    // The subtype has to match the representation:
    CHECK_BOSON_ERROR(readWith(standard, UuidAsJavaLegacyBinary::deserialize), InvalidUuidSubtype);
    CHECK_BOSON_ERROR(readWith(java, UuidAsBinary::deserialize), InvalidUuidSubtype);
}


TEST_CASE("Helpers in a struct through raw bytes", "[SerdeHelpers]") {
    RawSerializer s;
    s.beginDocument();
    s.writeField("count", uint64_t(1) << 40, U64AsF64::serialize);
    s.writeField("when", int64_t(1000), I64AsDateTime::serialize);
    s.endDocument();
    RawDocumentBuf raw = s.finish();

    CHECK(raw.asDocument().getDouble("count") == 1099511627776.0);
    CHECK(raw.asDocument().getDateTime("when").timestampMillis() == 1000);

    uint64_t count = 0;
    int64_t when = 0;
    RawDeserializer d(raw.asDocument());
    d.readDocument([&](string_view key, Deserializer &value) {
        if (key == "count")
            count = value.readWith(U64AsF64::deserialize);
        else if (key == "when")
            when = value.readWith(I64AsDateTime::deserialize);
    });
    CHECK(count == uint64_t(1) << 40);
    CHECK(when == 1000);
}
