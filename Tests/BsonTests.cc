//
// BsonTests.cc
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
#include "Bson.hh"
#include "RawDocumentBuf.hh"

using namespace std;


static Document everyType() {
    Decimal128 dec;
    dec.bytes[0] = 1;
    dec.bytes[15] = 0x30;
    auto oid = ObjectId::parse("5f1a2b3c4d5e6f7081920304");
    return Document {
        {"double",  3.25},
        {"string",  "hello"},
        {"doc",     Document{{"x", int32_t(1)}}},
        {"array",   Array{Bson(int32_t(1)), Bson("two"), Bson(Null())}},
        {"binary",  Binary(BinarySubtype::Generic, slice("\x01\x02\x03"))},
        {"oldbin",  Binary(BinarySubtype::BinaryOld, slice("xyz"))},
        {"undef",   Undefined()},
        {"oid",     oid},
        {"bool",    true},
        {"date",    DateTime::fromMillis(1234567890123)},
        {"null",    Null()},
        {"regex",   Regex("^a.*b$", "im")},
        {"dbptr",   DbPointer{"db.coll", oid}},
        {"code",    JavaScriptCode{"function() {}"}},
        {"symbol",  Symbol{"sym"}},
        {"cws",     JavaScriptCodeWithScope{"x + y", Document{{"x", int32_t(1)}, {"y", int64_t(2)}}}},
        {"int32",   int32_t(-7)},
        {"ts",      Timestamp{100, 3}},
        {"int64",   int64_t(1) << 50},
        {"dec",     dec},
        {"min",     MinKey()},
        {"max",     MaxKey()},
    };
}


TEST_CASE("Document basics", "[Bson]") {
    Document doc {{"a", int32_t(1)}, {"b", "two"}};
    CHECK(doc.size() == 2);
    CHECK(doc.contains("a"));
    CHECK(doc.getInt32("a") == 1);
    CHECK(doc.getStr("b") == "two");

    // Replacing a key keeps its position:
    optional<Bson> old = doc.insert("a", 3.5);
    REQUIRE(old);
    CHECK(old->as<int32_t>() == 1);
    CHECK(doc.begin()->first == "a");
    CHECK(doc.getDouble("a") == 3.5);

    CHECK(!doc.insert("c", true));
    CHECK(doc.size() == 3);

    optional<Bson> removed = doc.remove("b");
    REQUIRE(removed);
    CHECK(removed->as<string>() == "two");
    CHECK(!doc.remove("b"));
    CHECK(doc.size() == 2);

    CHECK_BOSON_ERROR(doc.getStr("zzz"), ValueAccessNotPresent);
    CHECK_BOSON_ERROR(doc.getStr("a"), ValueAccessUnexpectedType);
}


TEST_CASE("Bson accessors", "[Bson]") {
    Bson value(int64_t(12));
    CHECK(value.type() == ElementType::Int64);
    CHECK(value.is<int64_t>());
    CHECK(!value.is<int32_t>());
    CHECK(value.as<int64_t>() == 12);
    CHECK(value.getIf<int32_t>() == nullptr);
    CHECK_BOSON_ERROR(value.as<string>(), ValueAccessUnexpectedType);

    CHECK(Bson().isNull());
    CHECK(Bson().type() == ElementType::Null);
    CHECK(Bson(Regex("x", "xsi")).as<Regex>().options == "isx");
    CHECK(Bson::typeOf<Timestamp>() == ElementType::Timestamp);

    Bson uuid(Uuid::parse("00112233-4455-6677-8899-aabbccddeeff"));
    CHECK(uuid.type() == ElementType::Binary);
    CHECK(uuid.as<Binary>().subtype == BinarySubtype::Uuid);
}


TEST_CASE("Document encoding", "[Bson]") {
    Document doc {{"hello", "world"}};
    CHECK(sliceToHex(slice(doc.encode())) == "160000000268656C6C6F0006000000776F726C640000");

    Document empty;
    CHECK(sliceToHex(slice(empty.encode())) == "0500000000");
}


TEST_CASE("Document round trip through raw", "[Bson]") {
    Document doc = everyType();
    vector<uint8_t> bytes = doc.encode();

    Document decoded = Document::decode(slice(bytes));
    CHECK(decoded == doc);
    CHECK(decoded.size() == 22);
    CHECK(decoded.getAs<Binary>("oldbin").bytes == slice("xyz").asBytes());
    CHECK(decoded.getTimestamp("ts") == Timestamp{100, 3});

    // Decoding then re-encoding is byte-for-byte identical:
    CHECK(decoded.encode() == bytes);

    RawDocumentBuf raw = doc.toRaw();
    CHECK(raw.bytes() == bytes);
    CHECK(raw.toDocument() == doc);

    // The raw view sees the same values:
    RawDocument view = raw.asDocument();
    CHECK(view.getStr("string") == "hello");
    CHECK(view.getInt64("int64") == int64_t(1) << 50);
    CHECK(view.get("symbol")->asSymbol() == "sym");
    auto cws = view.get("cws")->asJavaScriptCodeWithScope();
    CHECK(cws.code == "x + y");
    CHECK(cws.scope.getInt64("y") == 2);
}


TEST_CASE("Raw values to Bson", "[Bson]") {
    RawDocumentBuf raw;
    raw.append("n", int32_t(5));
    raw.append("s", "str");
    Bson value = Bson::fromRaw(*raw.get("s"));
    CHECK(value == Bson("str"));
    CHECK(Bson::fromRaw(*raw.get("n")) == Bson(int32_t(5)));
    CHECK(Bson::fromRaw(RawBsonRef(raw)).as<Document>().getInt32("n") == 5);
}


TEST_CASE("Nesting depth limit", "[Bson]") {
    SECTION("Encoding") {
        Document doc {{"leaf", true}};
        for (int i = 0; i < 150; ++i)
            doc = Document{{"a", std::move(doc)}};
        CHECK_BOSON_ERROR(doc.encode(), DepthLimitExceeded);
    }
    SECTION("Decoding") {
        RawDocumentBuf inner;
        inner.append("leaf", true);
        for (int i = 0; i < 150; ++i) {
            RawDocumentBuf outer;
            outer.append("a", inner);
            inner = std::move(outer);
        }
        CHECK_BOSON_ERROR(Document::fromRaw(inner.asDocument()), DepthLimitExceeded);
    }
    SECTION("Within the limit") {
        Document doc {{"leaf", true}};
        for (int i = 0; i < 50; ++i)
            doc = Document{{"a", std::move(doc)}};
        CHECK(Document::decode(slice(doc.encode())) == doc);
    }
}


TEST_CASE("Encoding rejects NUL in keys and regexes", "[Bson]") {
    Document badKey {{string("a\0b", 3), int32_t(1)}};
    CHECK_BOSON_ERROR(badKey.encode(), InvalidCString);

    Document badRegex {{"r", Regex(string("a\0", 2), "")}};
    CHECK_BOSON_ERROR(badRegex.encode(), InvalidCString);
}


TEST_CASE("Decoding errors carry the key", "[Bson]") {
    // {"s": "\xFF"}
    auto bytes = hexToBytes("0E000000 027300 02000000 FF00 00");
    try {
        Document::decode(slice(bytes));
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.code == Utf8Encoding);
        CHECK(x.key == "s");
    }
}
