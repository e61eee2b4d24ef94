//
//  SupportTests.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "BosonTests.hh"
#include "BSONSpec.hh"
#include "Binary.hh"
#include "DateFormat.hh"
#include "DateTime.hh"
#include "NumConversion.hh"
#include "ObjectId.hh"
#include "UTF8.hh"
#include "slice_stream.hh"
#include <set>

using namespace std;


TEST_CASE("UTF-8 validation", "[Support]") {
    CHECK(IsValidUTF8(""_sl));
    CHECK(IsValidUTF8("plain ascii"_sl));
    CHECK(IsValidUTF8("caf\xC3\xA9"_sl));
    CHECK(IsValidUTF8("\xF0\x9F\x98\x80"_sl));                  // U+1F600
    CHECK(!IsValidUTF8("\xFF"_sl));
    CHECK(!IsValidUTF8("\xC0\xAF"_sl));                         // overlong
    CHECK(!IsValidUTF8("\xED\xA0\x80"_sl));                     // surrogate
    CHECK(!IsValidUTF8("\xF4\x90\x80\x80"_sl));                 // above U+10FFFF
    CHECK(!IsValidUTF8("\xE2\x82"_sl));                         // truncated

    CHECK(ValidUTF8Length("ab\xFF" "cd"_sl) == 2);

    CHECK(ReplaceInvalidUTF8("a\xFF" "b"_sl) == "a\xEF\xBF\xBD" "b");
    CHECK(ReplaceInvalidUTF8("caf\xC3\xA9"_sl) == "caf\xC3\xA9");
    // A truncated sequence is one maximal invalid subpart:
    CHECK(ReplaceInvalidUTF8("\xE2\x82" "x"_sl) == "\xEF\xBF\xBD" "x");
}


TEST_CASE("Hex", "[Support]") {
    CHECK(slice("\x01\xAB\xFF", 3).hexString() == "01abff");

    uint8_t out[2];
    CHECK(decodeHex("01aB"_sl, out, 2));
    CHECK(out[0] == 0x01);
    CHECK(out[1] == 0xAB);
    CHECK(!decodeHex("01a"_sl, out, 2));
    CHECK(!decodeHex("01xz"_sl, out, 2));
}


TEST_CASE("Exact numeric conversions", "[Support]") {
    CHECK(ExactIntCast<int32_t>(uint32_t(INT32_MAX)) == INT32_MAX);
    CHECK(!ExactIntCast<int32_t>(uint32_t(INT32_MAX) + 1));
    CHECK(!ExactIntCast<uint8_t>(int32_t(-1)));
    CHECK(ExactIntCast<int64_t>(int8_t(-5)) == -5);

    CHECK(ExactDouble(uint64_t(1) << 53) == 9007199254740992.0);
    CHECK(!ExactDouble((uint64_t(1) << 53) + 1));
    CHECK(!ExactDouble(UINT64_MAX));
    CHECK(!ExactDouble(UINT64_MAX - 255));
    CHECK(ExactDouble(0) == 0.0);

    CHECK(ExactDoubleFromInt64(-(int64_t(1) << 53)) == -9007199254740992.0);
    CHECK(!ExactDoubleFromInt64(-(int64_t(1) << 53) - 1));
    CHECK(!ExactDoubleFromInt64(INT64_MAX));
    CHECK(ExactDoubleFromInt64(INT64_MIN) == -9223372036854775808.0);
    CHECK(ExactDoubleFromInt64(-1) == -1.0);

    CHECK(ExactUInt32(42.0) == 42u);
    CHECK(!ExactUInt32(42.5));
    CHECK(!ExactUInt32(-1.0));
    CHECK(!ExactUInt32(4294967296.0));
    CHECK(ExactUInt64(1e15) == uint64_t(1000000000000000));
}


TEST_CASE("RFC 3339 formatting", "[Support]") {
    CHECK(DateFormat::formatRFC3339(0) == "1970-01-01T00:00:00Z");
    CHECK(DateFormat::formatRFC3339(851042397000) == "1996-12-20T00:39:57Z");
    CHECK(DateFormat::formatRFC3339(851042397123) == "1996-12-20T00:39:57.123Z");
    CHECK(DateFormat::formatRFC3339(-1) == "1969-12-31T23:59:59.999Z");
    CHECK(DateFormat::formatRFC3339(DateFormat::kMinMillis) == "0000-01-01T00:00:00Z");
    CHECK(DateFormat::formatRFC3339(DateFormat::kMaxMillis) == "9999-12-31T23:59:59.999Z");
    CHECK_BOSON_ERROR(DateFormat::formatRFC3339(DateFormat::kMaxMillis + 1), DateTimeRange);
    CHECK_BOSON_ERROR(DateFormat::formatRFC3339(DateFormat::kMinMillis - 1), DateTimeRange);
}


TEST_CASE("RFC 3339 parsing", "[Support]") {
    CHECK(DateFormat::parseRFC3339("1996-12-20T00:39:57Z"_sl) == 851042397000);
    CHECK(DateFormat::parseRFC3339("1996-12-20t00:39:57z"_sl) == 851042397000);
    CHECK(DateFormat::parseRFC3339("1996-12-20 00:39:57Z"_sl) == 851042397000);
    CHECK(DateFormat::parseRFC3339("1996-12-19T16:39:57-08:00"_sl) == 851042397000);
    CHECK(DateFormat::parseRFC3339("1996-12-20T01:39:57+01:00"_sl) == 851042397000);
    CHECK(DateFormat::parseRFC3339("1996-12-20T00:39:57.1Z"_sl) == 851042397100);
    CHECK(DateFormat::parseRFC3339("1996-12-20T00:39:57.123456Z"_sl) == 851042397123);
    CHECK(DateFormat::parseRFC3339("0000-01-01T00:00:00Z"_sl) == DateFormat::kMinMillis);

    CHECK(!DateFormat::parseRFC3339("1996-12-20"_sl));
    CHECK(!DateFormat::parseRFC3339("1996-13-20T00:39:57Z"_sl));
    CHECK(!DateFormat::parseRFC3339("1996-02-30T00:39:57Z"_sl));
    CHECK(!DateFormat::parseRFC3339("1996-12-20T24:00:00Z"_sl));
    CHECK(!DateFormat::parseRFC3339("1996-12-20T00:39:57"_sl));
    CHECK(!DateFormat::parseRFC3339("1996-12-20T00:39:57.Z"_sl));
    CHECK(!DateFormat::parseRFC3339("1996-12-20T00:39:57Zjunk"_sl));
}


TEST_CASE("DateTime", "[Support]") {
    DateTime d = DateTime::parseRfc3339("1996-12-20T00:39:57Z");
    CHECK(d.timestampMillis() == 851042397000);
    CHECK(d.toRfc3339() == "1996-12-20T00:39:57Z");
    CHECK(DateTime::fromMillis(5) < DateTime::fromMillis(6));
    CHECK_BOSON_ERROR(DateTime::parseRfc3339("nope"), InvalidDateString);
    CHECK_BOSON_ERROR(DateTime::kMin.toRfc3339(), DateTimeRange);

    DateTime now = DateTime::now();
    CHECK(now.timestampMillis() > 851042397000);
}


TEST_CASE("ObjectId", "[Support]") {
    ObjectId oid = ObjectId::parse("5f1a2b3c4d5e6f7081920304");
    CHECK(oid.toHex() == "5f1a2b3c4d5e6f7081920304");
    CHECK(oid.timestamp() == 0x5f1a2b3c);
    CHECK(ObjectId::parse("5F1A2B3C4D5E6F7081920304") == oid);
    CHECK_BOSON_ERROR(ObjectId::parse("5f1a2b3c"), InvalidHex);
    CHECK_BOSON_ERROR(ObjectId::parse("zz1a2b3c4d5e6f7081920304"), InvalidHex);
    CHECK(ObjectId() == ObjectId::fromBytes(slice(string(12, '\0'))));
    CHECK_THROWS_AS(ObjectId::fromBytes(slice("short")), std::invalid_argument);

    // Generated ids are unique, and stamped with the current time:
    set<ObjectId> ids;
    for (int i = 0; i < 1000; ++i)
        ids.insert(ObjectId::generate());
    CHECK(ids.size() == 1000);
    uint32_t now = uint32_t(DateTime::now().timestampMillis() / 1000);
    uint32_t stamp = ids.begin()->timestamp();
    CHECK(stamp <= now);
    CHECK(stamp + 60 >= now);
}


TEST_CASE("Uuid", "[Support]") {
    Uuid uuid = Uuid::parse("00112233-4455-6677-8899-aabbccddeeff");
    CHECK(uuid.toString() == "00112233-4455-6677-8899-aabbccddeeff");
    CHECK(Uuid::parse("00112233445566778899AABBCCDDEEFF") == uuid);
    CHECK_BOSON_ERROR(Uuid::parse("0011-2233"), InvalidHex);

    Uuid random = Uuid::generate();
    CHECK(random != Uuid::generate());
    CHECK((random.bytes()[6] & 0xF0) == 0x40);                 // version 4

    Binary bin = Binary::fromUuid(uuid, UuidRepresentation::JavaLegacy);
    CHECK(bin.subtype == BinarySubtype::UuidOld);
    CHECK(sliceToHex(bin.asSlice()) == "7766554433221100FFEEDDCCBBAA9988");
    CHECK(bin.toUuid(UuidRepresentation::JavaLegacy) == uuid);
    CHECK_BOSON_ERROR(bin.toUuid(UuidRepresentation::Standard), InvalidUuidSubtype);

    Binary shortBin(BinarySubtype::Uuid, slice("short"));
    CHECK_BOSON_ERROR(shortBin.toUuid(), MalformedValue);
}


TEST_CASE("Element types", "[Support]") {
    CHECK(ElementTypeFromByte(0x01) == ElementType::Double);
    CHECK(ElementTypeFromByte(0x13) == ElementType::Decimal128);
    CHECK(ElementTypeFromByte(0x7F) == ElementType::MaxKey);
    CHECK(ElementTypeFromByte(0xFF) == ElementType::MinKey);
    CHECK(!ElementTypeFromByte(0x00));
    CHECK(!ElementTypeFromByte(0x14));
    CHECK(!ElementTypeFromByte(0x80));
    CHECK(string(ElementTypeName(ElementType::Int32)) == "int32");
}


TEST_CASE("Exception paths", "[Support]") {
    BosonException x(DeserializationError, "bad value");
    CHECK(x.path().empty());
    x.prependPathKey("value");
    x.prependPathIndex(3);
    x.prependPathKey("items");
    CHECK(x.path() == "items[3].value");
    CHECK(string(x.what()) == "bad value (at path \"items[3].value\")");
    CHECK(BosonException::getCode(x) == DeserializationError);
    CHECK(BosonException::getCode(std::runtime_error("other")) == InternalError);
}


TEST_CASE("slice_istream", "[Support]") {
    slice_istream in("12ab\0rest"_sl);
    int n = 0;
    CHECK(in.readDigits(2, n));
    CHECK(n == 12);
    CHECK(in.readToDelimiter(0) == "ab"_sl);
    CHECK(in.peekByte() == 'r');
    CHECK(in.readByte() == 'r');
    CHECK(in.bytesRemaining() == 3);
    CHECK(!in.readToDelimiter(0));
}
