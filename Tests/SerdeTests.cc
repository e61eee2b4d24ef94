//
// SerdeTests.cc
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
#include "Serde.hh"

using namespace std;


namespace {
    struct Person {
        string              name;
        int32_t             age {0};
        optional<string>    email;
        vector<string>      tags;
        ObjectId            id;
        DateTime            born;

        bool operator== (const Person &p) const {
            return name == p.name && age == p.age && email == p.email && tags == p.tags
                && id == p.id && born == p.born;
        }
    };
}

namespace boson {
    template <>
    struct Serialize<Person> {
        static void serialize(const Person &p, Serializer &s) {
            s.beginDocument();
            s.writeField("name", p.name);
            s.writeField("age", p.age);
            s.writeField("email", p.email);
            s.writeField("tags", p.tags);
            s.writeField("id", p.id);
            s.writeField("born", p.born);
            s.endDocument();
        }
    };

    template <>
    struct Deserialize<Person> {
        static Person deserialize(Deserializer &d) {
            Person p;
            d.readDocument([&](string_view key, Deserializer &value) {
                if (key == "name")          p.name = value.read<string>();
                else if (key == "age")      p.age = value.read<int32_t>();
                else if (key == "email")    p.email = value.read<optional<string>>();
                else if (key == "tags")     p.tags = value.read<vector<string>>();
                else if (key == "id")       p.id = value.read<ObjectId>();
                else if (key == "born")     p.born = value.read<DateTime>();
            });
            return p;
        }
    };
}


static Person samplePerson() {
    Person p;
    p.name = "Ada";
    p.age = 36;
    p.tags = {"math", "engines"};
    p.id = ObjectId::parse("5f1a2b3c4d5e6f7081920304");
    p.born = DateTime::fromMillis(-4858444800000);      // 1816-01-17
    return p;
}


TEST_CASE("Serialize struct to Document", "[Serde]") {
    Person p = samplePerson();
    Document doc = serializeToDocument(p);
    CHECK(doc.size() == 6);
    CHECK(doc.getStr("name") == "Ada");
    CHECK(doc.getInt32("age") == 36);
    CHECK(doc.isNull("email"));
    CHECK(doc.getArray("tags").size() == 2);
    CHECK(doc.getObjectId("id") == p.id);
    CHECK(doc.getDateTime("born") == p.born);

    CHECK(deserializeFromDocument<Person>(doc) == p);
}


TEST_CASE("Serialize struct to bytes", "[Serde]") {
    Person p = samplePerson();
    p.email = "ada@example.com";
    vector<uint8_t> bytes = serializeToVec(p);

    // Both serializers produce the same encoding:
    CHECK(bytes == serializeToDocument(p).encode());

    CHECK(deserializeFromSlice<Person>(slice(bytes)) == p);

    RawDocumentBuf raw = serializeToRawDocumentBuf(p);
    CHECK(raw.bytes() == bytes);
    CHECK(deserializeFromRawDocument<Person>(raw.asDocument()) == p);
}


TEST_CASE("Human-readable mode", "[Serde]") {
    Person p = samplePerson();
    Document doc = serializeToDocument(HumanReadable<Person>{p});
    CHECK(doc.getStr("id") == "5f1a2b3c4d5e6f7081920304");
    CHECK(doc.getStr("born") == "1816-01-17T00:00:00Z");

    // The same result from the options:
    SerializerOptions options;
    options.humanReadable = true;
    CHECK(serializeToDocument(p, options) == doc);

    CHECK(deserializeFromDocument<HumanReadable<Person>>(doc).value == p);
    // Textual forms are accepted without the wrapper too:
    CHECK(deserializeFromDocument<Person>(doc) == p);

    // The mode ends with the wrapped value:
    Document pair = serializeToDocument(map<string, Bson>{
        {"a", serializeToBson(HumanReadable<ObjectId>{p.id})},
        {"b", serializeToBson(p.id)}});
    CHECK(pair.getStr("a") == p.id.toHex());
    CHECK(pair.getObjectId("b") == p.id);

    // A second human-readable pass over the decoded value gives identical bytes:
    vector<uint8_t> first = serializeToVec(HumanReadable<Person>{p});
    Person again = deserializeFromSlice<HumanReadable<Person>>(slice(first)).value;
    CHECK(serializeToVec(HumanReadable<Person>{again}) == first);
}


TEST_CASE("Human-readable extended types", "[Serde]") {
    SerializerOptions hr;
    hr.humanReadable = true;

    Bson ts = serializeToBson(Timestamp{12, 34}, hr);
    REQUIRE(ts.is<Document>());
    CHECK(ts.as<Document>().getInt32("t") == 12);
    CHECK(ts.as<Document>().getInt32("i") == 34);
    CHECK(deserializeFromBson<Timestamp>(ts) == Timestamp{12, 34});
    CHECK(serializeToBson(Timestamp{12, 34}) == Bson(Timestamp{12, 34}));

    Uuid uuid = Uuid::parse("00112233-4455-6677-8899-aabbccddeeff");
    CHECK(serializeToBson(uuid, hr) == Bson("00112233-4455-6677-8899-aabbccddeeff"));
    Bson bin = serializeToBson(uuid);
    REQUIRE(bin.is<Binary>());
    CHECK(bin.as<Binary>().subtype == BinarySubtype::Uuid);
    CHECK(deserializeFromBson<Uuid>(bin) == uuid);
    CHECK(deserializeFromBson<Uuid>(Bson("00112233445566778899aabbccddeeff")) == uuid);
}


TEST_CASE("Lossy UTF-8", "[Serde]") {
    // {"name": "a\xFF"}
    auto bytes = hexToBytes("12000000 026E616D6500 03000000 61FF00 00");

    CHECK_BOSON_ERROR(deserializeFromSlice<Person>(slice(bytes)), Utf8Encoding);

    Person p = deserializeFromSlice<Utf8Lossy<Person>>(slice(bytes)).value;
    CHECK(p.name == "a\xEF\xBF\xBD");

    DeserializerOptions options;
    options.utf8Lossy = true;
    CHECK(deserializeFromSlice<Person>(slice(bytes), options).name == "a\xEF\xBF\xBD");

    // Serializing the wrapper is the same as serializing the value:
    Person q = samplePerson();
    CHECK(serializeToVec(Utf8Lossy<Person>{q}) == serializeToVec(q));
}


TEST_CASE("Lossy UTF-8 keys", "[Serde]") {
    // {"\xFF": 1}
    auto bytes = hexToBytes("0C000000 10FF00 01000000 00");
    CHECK_BOSON_ERROR(deserializeFromSlice<Document>(slice(bytes)), Utf8Encoding);

    using IntMap = map<string, int32_t>;
    IntMap m = deserializeFromSlice<Utf8Lossy<IntMap>>(slice(bytes)).value;
    CHECK(m.size() == 1);
    CHECK(m["\xEF\xBF\xBD"] == 1);
}


TEST_CASE("Lossy UTF-8 in regexes, pointers and scoped code", "[Serde]") {
    // {"r": /a\xFF/i}
    auto regexBytes = hexToBytes("0D000000 0B7200 61FF00 6900 00");
    // {"p": DbPointer("d\xFF", 000000000000000000000000)}
    auto pointerBytes = hexToBytes("1B000000 0C7000 03000000 64FF00 000000000000000000000000 00");
    // {"c": Code("x\xFF", {})}
    auto codeBytes = hexToBytes("18000000 0F6300 10000000 03000000 78FF00 0500000000 00");

    using RegexMap = map<string, Regex>;
    using PointerMap = map<string, DbPointer>;
    using CodeMap = map<string, JavaScriptCodeWithScope>;

    CHECK_BOSON_ERROR(deserializeFromSlice<RegexMap>(slice(regexBytes)), Utf8Encoding);
    CHECK_BOSON_ERROR(deserializeFromSlice<PointerMap>(slice(pointerBytes)), Utf8Encoding);
    CHECK_BOSON_ERROR(deserializeFromSlice<CodeMap>(slice(codeBytes)), Utf8Encoding);

    RegexMap regexes = deserializeFromSlice<Utf8Lossy<RegexMap>>(slice(regexBytes)).value;
    CHECK(regexes["r"] == Regex("a\xEF\xBF\xBD", "i"));

    PointerMap pointers = deserializeFromSlice<Utf8Lossy<PointerMap>>(slice(pointerBytes)).value;
    CHECK(pointers["p"] == (DbPointer{"d\xEF\xBF\xBD", ObjectId()}));

    CodeMap code = deserializeFromSlice<Utf8Lossy<CodeMap>>(slice(codeBytes)).value;
    CHECK(code["c"] == (JavaScriptCodeWithScope{"x\xEF\xBF\xBD", Document{}}));

    // The same through the Bson value model:
    Document doc = deserializeFromSlice<Utf8Lossy<Document>>(slice(regexBytes)).value;
    CHECK(doc.getRegex("r").pattern == "a\xEF\xBF\xBD");
}


TEST_CASE("Error paths", "[Serde]") {
    using Nested = map<string, map<string, int32_t>>;
    Document doc {
        {"one", Document{{"value", int32_t(1)}}},
        {"two", Document{{"value", "oops"}}},
    };
    vector<uint8_t> bytes = doc.encode();

    DeserializerOptions options;
    options.trackPath = true;
    try {
        deserializeFromSlice<Nested>(slice(bytes), options);
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.code == DeserializationError);
        CHECK(x.path() == "two.value");
        CHECK(string(x.what()).find("(at path \"two.value\")") != string::npos);
    }

    // Without tracking there's no path:
    try {
        deserializeFromDocument<Nested>(doc);
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.code == DeserializationError);
        CHECK(x.path().empty());
    }

    // Array indexes:
    using ListOfMaps = map<string, vector<map<string, int32_t>>>;
    Document list {{"items", Array{Bson(Document{{"value", int32_t(1)}}),
                                   Bson(Document{{"value", 2.5}})}}};
    try {
        deserializeFromDocument<ListOfMaps>(list, options);
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.path() == "items[1].value");
    }

    // Serialization:
    SerializerOptions sopts;
    sopts.trackPath = true;
    try {
        serializeToBson(map<string, uint64_t>{{"big", UINT64_MAX}}, sopts);
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.code == LossyConversion);
        CHECK(x.path() == "big");
    }
}


TEST_CASE("Integer conversions", "[Serde]") {
    CHECK(serializeToBson(uint32_t(5)) == Bson(int32_t(5)));
    CHECK(serializeToBson(uint32_t(3000000000u)) == Bson(int64_t(3000000000)));
    CHECK(serializeToBson(uint64_t(INT64_MAX)) == Bson(int64_t(INT64_MAX)));
    CHECK_BOSON_ERROR(serializeToBson(uint64_t(INT64_MAX) + 1), LossyConversion);
    CHECK(serializeToBson(int16_t(-3)) == Bson(int32_t(-3)));
    CHECK(serializeToBson(int64_t(7)) == Bson(int64_t(7)));

    CHECK(deserializeFromBson<int32_t>(Bson(int64_t(5))) == 5);
    CHECK(deserializeFromBson<int64_t>(Bson(int32_t(-5))) == -5);
    CHECK(deserializeFromBson<uint8_t>(Bson(int32_t(255))) == 255);
    CHECK_BOSON_ERROR(deserializeFromBson<uint8_t>(Bson(int32_t(256))), DeserializationError);
    CHECK_BOSON_ERROR(deserializeFromBson<uint32_t>(Bson(int32_t(-1))), DeserializationError);
    CHECK_BOSON_ERROR(deserializeFromBson<int32_t>(Bson("5")), DeserializationError);
    CHECK(deserializeFromBson<double>(Bson(int32_t(2))) == 2.0);
    CHECK(deserializeFromBson<float>(Bson(0.5)) == 0.5f);

    // An int64 read as a double has to convert exactly:
    const int64_t twoTo53 = int64_t(1) << 53;
    CHECK(deserializeFromBson<double>(Bson(twoTo53)) == 9007199254740992.0);
    CHECK_BOSON_ERROR(deserializeFromBson<double>(Bson(twoTo53 + 1)), LossyConversion);
    CHECK_BOSON_ERROR(deserializeFromBson<double>(Bson(-twoTo53 - 1)), LossyConversion);
    CHECK(deserializeFromBson<double>(Bson(int64_t(INT64_MIN))) == -9223372036854775808.0);

    Document big {{"n", twoTo53 + 1}};
    CHECK_BOSON_ERROR((deserializeFromSlice<map<string, double>>(slice(big.encode()))),
                      LossyConversion);
}


TEST_CASE("Containers", "[Serde]") {
    vector<uint8_t> bytes = {1, 2, 3};
    Bson bin = serializeToBson(bytes);
    REQUIRE(bin.is<Binary>());
    CHECK(bin.as<Binary>().subtype == BinarySubtype::Generic);
    CHECK(deserializeFromBson<vector<uint8_t>>(bin) == bytes);

    pair<string, int32_t> p {"x", 9};
    Bson arr = serializeToBson(p);
    REQUIRE(arr.is<Array>());
    CHECK(arr.as<Array>().size() == 2);
    CHECK((deserializeFromBson<pair<string, int32_t>>(arr) == p));
    CHECK_BOSON_ERROR((deserializeFromBson<pair<string, int32_t>>(Bson(Array{Bson("x")}))),
                      DeserializationError);

    CHECK(serializeToBson(optional<int32_t>()) == Bson(Null()));
    CHECK(deserializeFromBson<optional<int32_t>>(Bson(Null())) == nullopt);
    CHECK(deserializeFromBson<optional<int32_t>>(Bson(int32_t(4))) == 4);

    map<string, vector<int32_t>> m {{"a", {1, 2}}, {"b", {}}};
    CHECK((deserializeFromDocument<map<string, vector<int32_t>>>(serializeToDocument(m)) == m));
}


TEST_CASE("Bson values pass through", "[Serde]") {
    Document doc {
        {"regex", Regex("a", "i")},
        {"code", JavaScriptCode{"f()"}},
        {"cws", JavaScriptCodeWithScope{"g()", Document{{"v", true}}}},
        {"sym", Symbol{"s"}},
        {"ptr", DbPointer{"db.c", ObjectId::parse("000000000000000000000001")}},
        {"min", MinKey()},
        {"undef", Undefined()},
    };
    vector<uint8_t> bytes = serializeToVec(doc);
    CHECK(bytes == doc.encode());
    CHECK(deserializeFromSlice<Document>(slice(bytes)) == doc);
    CHECK(deserializeFromSlice<Bson>(slice(bytes)) == Bson(doc));

    RawDocumentBuf raw = doc.toRaw();
    CHECK(serializeToVec(raw) == bytes);
    CHECK(deserializeFromSlice<RawDocumentBuf>(slice(bytes)) == raw);
}


TEST_CASE("Valueless types", "[Serde]") {
    CHECK(deserializeFromBson<Undefined>(serializeToBson(Undefined())) == Undefined());
    CHECK(deserializeFromBson<MinKey>(serializeToBson(MinKey())) == MinKey());
    CHECK(deserializeFromBson<MaxKey>(serializeToBson(MaxKey())) == MaxKey());

    CHECK_BOSON_ERROR(deserializeFromBson<MinKey>(Bson(MaxKey())), DeserializationError);
    CHECK_BOSON_ERROR(deserializeFromBson<MaxKey>(Bson(Null())), DeserializationError);
    CHECK_BOSON_ERROR(deserializeFromBson<Undefined>(Bson(Null())), DeserializationError);

    // Through raw bytes, with the path of a mismatch:
    map<string, MinKey> keys {{"low", MinKey()}};
    vector<uint8_t> bytes = serializeToVec(keys);
    CHECK((deserializeFromSlice<map<string, MinKey>>(slice(bytes)) == keys));

    DeserializerOptions options;
    options.trackPath = true;
    Document wrong {{"low", MaxKey()}};
    try {
        deserializeFromSlice<map<string, MinKey>>(slice(wrong.encode()), options);
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.code == DeserializationError);
        CHECK(x.path() == "low");
    }
}


TEST_CASE("Raw buffers and views", "[Serde]") {
    RawArrayBuf array;
    array.push(int32_t(1));
    array.push("two");

    Bson value = serializeToBson(array);
    REQUIRE(value.is<Array>());
    CHECK(value == Bson(Array{Bson(int32_t(1)), Bson("two")}));
    CHECK(deserializeFromBson<RawArrayBuf>(value) == array);
    CHECK(deserializeFromBson<RawArrayBuf>(value).count() == 2);
    CHECK_BOSON_ERROR(deserializeFromBson<RawArrayBuf>(Bson(int32_t(1))), DeserializationError);

    map<string, RawArrayBuf> withArray {{"list", array}};
    vector<uint8_t> bytes = serializeToVec(withArray);
    CHECK((deserializeFromSlice<map<string, RawArrayBuf>>(slice(bytes)) == withArray));

    // Borrowed views serialize like the buffers they point into:
    CHECK(serializeToBson(array.asArray()) == value);
    RawDocumentBuf doc;
    doc.append("list", array);
    CHECK(serializeToVec(doc.asDocument()) == doc.bytes());
    CHECK(serializeToBson(doc.asDocument()) == Bson(Document{{"list", value}}));

    // Encoding a typed array:
    CHECK(RawArrayBuf::fromArray(value.as<Array>()) == array);
    CHECK(RawArrayBuf::fromArray(Array{}).empty());

    Array badKey {Bson(Document{{string("a\0b", 3), int32_t(1)}})};
    CHECK_BOSON_ERROR(RawArrayBuf::fromArray(badKey), InvalidCString);

    Bson nested(Array{});
    for (int i = 0; i < 150; ++i)
        nested = Bson(Array{nested});
    CHECK_BOSON_ERROR(RawArrayBuf::fromArray(nested.as<Array>()), DepthLimitExceeded);
}


TEST_CASE("Serializer misuse", "[Serde]") {
    CHECK_BOSON_ERROR(serializeToVec(int32_t(1)), SerializationError);   // top level must be a document

    BsonSerializer s;
    CHECK_BOSON_ERROR(s.finish(), SerializationError);
    s.beginDocument();
    CHECK_BOSON_ERROR(s.writeInt32(1), SerializationError);             // no key
    s.writeKey("a");
    CHECK_BOSON_ERROR(s.writeKey("b"), SerializationError);             // key already pending
    s.writeInt32(1);
    CHECK_BOSON_ERROR(s.finish(), SerializationError);                  // still open
    s.endDocument();
    CHECK(s.finish() == Bson(Document{{"a", int32_t(1)}}));

    RawSerializer r;
    r.beginDocument();
    CHECK_BOSON_ERROR(r.writeKey(string_view("a\0", 2)), InvalidCString);
    r.endDocument();
    CHECK(r.finish().empty());
}


TEST_CASE("deserializeAny", "[Serde]") {
    struct Summer : public Visitor {
        int64_t sum = 0;
        const char* expecting() const override      {return "a number or an array of numbers";}
        void visitInt32(int32_t i) override         {sum += i;}
        void visitInt64(int64_t i) override         {sum += i;}
        void visitArray(Deserializer &d) override {
            d.readArray([&](size_t, Deserializer &item) {item.deserializeAny(*this);});
        }
    };

    Summer summer;
    Bson numbers(Array{Bson(int32_t(1)), Bson(int64_t(2)), Bson(Array{Bson(int32_t(3))})});
    BsonDeserializer d(numbers);
    d.deserializeAny(summer);
    CHECK(summer.sum == 6);

    Bson str("nope");
    BsonDeserializer d2(str);
    try {
        d2.deserializeAny(summer);
        FAIL("expected an exception");
    } catch (const BosonException &x) {
        CHECK(x.code == DeserializationError);
        CHECK(string(x.what()).find("expected a number or an array of numbers") != string::npos);
    }
}
