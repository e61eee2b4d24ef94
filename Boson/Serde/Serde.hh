//
// Serde.hh
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
#include "Serializer.hh"
#include "Deserializer.hh"
#include "NumConversion.hh"
#include "RawArrayBuf.hh"
#include <map>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace boson {

    /** Wrapping a value in HumanReadable makes it, and everything nested inside it, use the
        human-readable representation of each type: ObjectIds as hex strings, DateTimes as
        RFC 3339 strings, Uuids as hyphenated strings, Timestamps as `{t, i}` documents. */
    template <class T>
    struct HumanReadable {
        T value;

        bool operator== (const HumanReadable &h) const  {return value == h.value;}
        bool operator!= (const HumanReadable &h) const  {return value != h.value;}
    };


    /** Wrapping a value in Utf8Lossy makes deserialization from encoded bytes replace invalid
        UTF-8 in strings (and keys) with U+FFFD instead of failing. It has no effect when
        serializing, or when deserializing from a Bson value. */
    template <class T>
    struct Utf8Lossy {
        T value;

        bool operator== (const Utf8Lossy &u) const      {return value == u.value;}
        bool operator!= (const Utf8Lossy &u) const      {return value != u.value;}
    };


#pragma mark - PRIMITIVES:


    template <>
    struct Serialize<bool> {
        static void serialize(bool b, Serializer &s)    {s.writeBool(b);}
    };
    template <>
    struct Deserialize<bool> {
        static bool deserialize(Deserializer &d)        {return d.readBool();}
    };


    // Signed integers are written as int32 or int64 depending on their width. Unsigned ones are
    // written as int32 if the value fits, else int64, else it's an error.
    template <class T>
    struct Serialize<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
        static void serialize(T value, Serializer &s) {
            if constexpr (std::is_signed_v<T> && sizeof(T) <= sizeof(int32_t)) {
                s.writeInt32(value);
            } else if constexpr (std::is_signed_v<T>) {
                s.writeInt64(value);
            } else {
                if (auto i32 = ExactIntCast<int32_t>(value); i32)
                    s.writeInt32(*i32);
                else if (auto i64 = ExactIntCast<int64_t>(value); i64)
                    s.writeInt64(*i64);
                else
                    BosonException::_throw(LossyConversion, "%llu does not fit in an int64",
                                           (unsigned long long)value);
            }
        }
    };

    template <class T>
    struct Deserialize<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
        static T deserialize(Deserializer &d) {
            int64_t i = d.readInt64();
            if (auto result = ExactIntCast<T>(i); result)
                return *result;
            BosonException::_throw(DeserializationError,
                                   "invalid value: integer %lld is out of range", (long long)i);
        }
    };


    template <class T>
    struct Serialize<T, std::enable_if_t<std::is_floating_point_v<T>>> {
        static void serialize(T value, Serializer &s)   {s.writeDouble(double(value));}
    };
    template <class T>
    struct Deserialize<T, std::enable_if_t<std::is_floating_point_v<T>>> {
        static T deserialize(Deserializer &d)           {return T(d.readDouble());}
    };


    template <>
    struct Serialize<std::string> {
        static void serialize(const std::string &str, Serializer &s) {s.writeString(str);}
    };
    template <>
    struct Serialize<std::string_view> {
        static void serialize(std::string_view str, Serializer &s)   {s.writeString(str);}
    };
    template <size_t N>
    struct Serialize<char[N]> {
        static void serialize(const char *str, Serializer &s)        {s.writeString(str);}
    };
    template <>
    struct Deserialize<std::string> {
        static std::string deserialize(Deserializer &d) {return d.readString();}
    };


#pragma mark - CONTAINERS:


    /// Vectors are arrays, except that a vector of bytes is generic binary data.
    template <class T>
    struct Serialize<std::vector<T>, std::enable_if_t<!std::is_same_v<T, uint8_t>>> {
        static void serialize(const std::vector<T> &items, Serializer &s) {
            s.beginArray();
            for (size_t i = 0; i < items.size(); ++i)
                s.writeItem(i, items[i]);
            s.endArray();
        }
    };
    template <class T>
    struct Deserialize<std::vector<T>, std::enable_if_t<!std::is_same_v<T, uint8_t>>> {
        static std::vector<T> deserialize(Deserializer &d) {
            std::vector<T> items;
            d.readArray([&](size_t, Deserializer &item) {
                items.push_back(item.read<T>());
            });
            return items;
        }
    };

    template <>
    struct Serialize<std::vector<uint8_t>> {
        static void serialize(const std::vector<uint8_t> &bytes, Serializer &s) {
            s.writeBinary(BinarySubtype::Generic, slice(bytes));
        }
    };
    template <>
    struct Deserialize<std::vector<uint8_t>> {
        static std::vector<uint8_t> deserialize(Deserializer &d) {return d.readBinary().bytes;}
    };


    /// An empty optional is null.
    template <class T>
    struct Serialize<std::optional<T>> {
        static void serialize(const std::optional<T> &opt, Serializer &s) {
            if (opt)
                s.write(*opt);
            else
                s.writeNull();
        }
    };
    template <class T>
    struct Deserialize<std::optional<T>> {
        static std::optional<T> deserialize(Deserializer &d) {
            if (d.isNull())
                return std::nullopt;
            return d.read<T>();
        }
    };


    template <class T>
    struct Serialize<std::map<std::string, T>> {
        static void serialize(const std::map<std::string, T> &map, Serializer &s) {
            s.beginDocument();
            for (auto &entry : map)
                s.writeField(entry.first, entry.second);
            s.endDocument();
        }
    };
    template <class T>
    struct Deserialize<std::map<std::string, T>> {
        static std::map<std::string, T> deserialize(Deserializer &d) {
            std::map<std::string, T> map;
            d.readDocument([&](std::string_view key, Deserializer &value) {
                map.insert_or_assign(std::string(key), value.read<T>());
            });
            return map;
        }
    };


    /// A pair is a two-item array.
    template <class A, class B>
    struct Serialize<std::pair<A, B>> {
        static void serialize(const std::pair<A, B> &pair, Serializer &s) {
            s.beginArray();
            s.writeItem(0, pair.first);
            s.writeItem(1, pair.second);
            s.endArray();
        }
    };
    template <class A, class B>
    struct Deserialize<std::pair<A, B>> {
        static std::pair<A, B> deserialize(Deserializer &d) {
            std::pair<A, B> pair;
            size_t count = 0;
            d.readArray([&](size_t index, Deserializer &item) {
                if (index == 0)
                    pair.first = item.read<A>();
                else if (index == 1)
                    pair.second = item.read<B>();
                ++count;
            });
            throwIf(count != 2, DeserializationError,
                    "invalid length %zu, expected an array of 2 items", count);
            return pair;
        }
    };


#pragma mark - BSON TYPES:


    template <>
    struct Serialize<ObjectId> {
        static void serialize(const ObjectId &oid, Serializer &s) {
            if (s.isHumanReadable())
                s.writeString(oid.toHex());
            else
                s.writeObjectId(oid);
        }
    };
    template <>
    struct Deserialize<ObjectId> {
        static ObjectId deserialize(Deserializer &d) {
            if (d.currentType() == ElementType::String)
                return ObjectId::parse(d.readString());
            return d.readObjectId();
        }
    };


    template <>
    struct Serialize<DateTime> {
        static void serialize(DateTime date, Serializer &s) {
            if (s.isHumanReadable())
                s.writeString(date.toRfc3339());
            else
                s.writeDateTime(date);
        }
    };
    template <>
    struct Deserialize<DateTime> {
        static DateTime deserialize(Deserializer &d) {
            if (d.currentType() == ElementType::String)
                return DateTime::parseRfc3339(d.readString());
            return d.readDateTime();
        }
    };


    template <>
    struct Serialize<Uuid> {
        static void serialize(const Uuid &uuid, Serializer &s) {
            if (s.isHumanReadable())
                s.writeString(uuid.toString());
            else
                s.writeBinary(BinarySubtype::Uuid, uuid.asSlice());
        }
    };
    template <>
    struct Deserialize<Uuid> {
        static Uuid deserialize(Deserializer &d) {
            if (d.currentType() == ElementType::String)
                return Uuid::parse(d.readString());
            return d.readBinary().toUuid(UuidRepresentation::Standard);
        }
    };


    template <>
    struct Serialize<Timestamp> {
        static void serialize(Timestamp ts, Serializer &s) {
            if (s.isHumanReadable()) {
                s.beginDocument();
                s.writeField("t", ts.time);
                s.writeField("i", ts.increment);
                s.endDocument();
            } else {
                s.writeTimestamp(ts);
            }
        }
    };
    template <>
    struct Deserialize<Timestamp> {
        static Timestamp deserialize(Deserializer &d) {
            if (d.currentType() != ElementType::EmbeddedDocument)
                return d.readTimestamp();
            std::optional<uint32_t> time, increment;
            d.readDocument([&](std::string_view key, Deserializer &value) {
                if (key == "t")
                    time = value.read<uint32_t>();
                else if (key == "i")
                    increment = value.read<uint32_t>();
            });
            throwIf(!time || !increment, DeserializationError,
                    "missing field \"%s\" in Timestamp", (time ? "i" : "t"));
            return Timestamp{*time, *increment};
        }
    };


    template <>
    struct Serialize<Binary> {
        static void serialize(const Binary &bin, Serializer &s) {s.writeBinary(bin.subtype, bin.asSlice());}
    };
    template <>
    struct Deserialize<Binary> {
        static Binary deserialize(Deserializer &d)      {return d.readBinary();}
    };

    template <>
    struct Serialize<Regex> {
        static void serialize(const Regex &r, Serializer &s) {s.writeRegex(r.pattern, r.options);}
    };
    template <>
    struct Deserialize<Regex> {
        static Regex deserialize(Deserializer &d)       {return d.readRegex();}
    };

    template <>
    struct Serialize<JavaScriptCode> {
        static void serialize(const JavaScriptCode &c, Serializer &s) {s.writeJavaScriptCode(c.code);}
    };
    template <>
    struct Deserialize<JavaScriptCode> {
        static JavaScriptCode deserialize(Deserializer &d) {return d.readJavaScriptCode();}
    };

    template <>
    struct Serialize<Symbol> {
        static void serialize(const Symbol &sym, Serializer &s) {s.writeSymbol(sym.symbol);}
    };
    template <>
    struct Deserialize<Symbol> {
        static Symbol deserialize(Deserializer &d)      {return d.readSymbol();}
    };

    template <>
    struct Serialize<JavaScriptCodeWithScope> {
        static void serialize(const JavaScriptCodeWithScope &c, Serializer &s) {
            s.writeJavaScriptCodeWithScope(c.code, c.scope);
        }
    };
    template <>
    struct Deserialize<JavaScriptCodeWithScope> {
        static JavaScriptCodeWithScope deserialize(Deserializer &d) {return d.readJavaScriptCodeWithScope();}
    };

    template <>
    struct Serialize<DbPointer> {
        static void serialize(const DbPointer &p, Serializer &s) {s.writeDbPointer(p.namespace_, p.id);}
    };
    template <>
    struct Deserialize<DbPointer> {
        static DbPointer deserialize(Deserializer &d)   {return d.readDbPointer();}
    };

    template <>
    struct Serialize<Decimal128> {
        static void serialize(const Decimal128 &dec, Serializer &s) {s.writeDecimal128(dec);}
    };
    template <>
    struct Deserialize<Decimal128> {
        static Decimal128 deserialize(Deserializer &d)  {return d.readDecimal128();}
    };

    template <>
    struct Serialize<Null> {
        static void serialize(Null, Serializer &s)      {s.writeNull();}
    };
    template <>
    struct Deserialize<Null> {
        static Null deserialize(Deserializer &d)        {d.readNull(); return Null();}
    };

    template <>
    struct Serialize<Undefined> {
        static void serialize(Undefined, Serializer &s) {s.writeUndefined();}
    };
    template <>
    struct Deserialize<Undefined> {
        static Undefined deserialize(Deserializer &d) {
            if (d.currentType() != ElementType::Undefined)
                d.invalidType("undefined");
            return Undefined();
        }
    };

    template <>
    struct Serialize<MinKey> {
        static void serialize(MinKey, Serializer &s)    {s.writeMinKey();}
    };
    template <>
    struct Deserialize<MinKey> {
        static MinKey deserialize(Deserializer &d) {
            if (d.currentType() != ElementType::MinKey)
                d.invalidType("MinKey");
            return MinKey();
        }
    };

    template <>
    struct Serialize<MaxKey> {
        static void serialize(MaxKey, Serializer &s)    {s.writeMaxKey();}
    };
    template <>
    struct Deserialize<MaxKey> {
        static MaxKey deserialize(Deserializer &d) {
            if (d.currentType() != ElementType::MaxKey)
                d.invalidType("MaxKey");
            return MaxKey();
        }
    };


    template <>
    struct Serialize<Bson> {
        static void serialize(const Bson &value, Serializer &s) {s.writeBson(value);}
    };
    template <>
    struct Deserialize<Bson> {
        static Bson deserialize(Deserializer &d)        {return d.readBson();}
    };

    template <>
    struct Serialize<Document> {
        static void serialize(const Document &doc, Serializer &s) {s.writeDocument(doc);}
    };
    template <>
    struct Deserialize<Document> {
        static Document deserialize(Deserializer &d) {
            if (d.currentType() != ElementType::EmbeddedDocument)
                d.invalidType("a document");
            Bson value = d.readBson();
            return std::move(value.as<Document>());
        }
    };

    template <>
    struct Serialize<RawDocumentBuf> {
        static void serialize(const RawDocumentBuf &doc, Serializer &s) {s.writeRawDocument(doc);}
    };
    template <>
    struct Deserialize<RawDocumentBuf> {
        static RawDocumentBuf deserialize(Deserializer &d) {return d.read<Document>().toRaw();}
    };

    template <>
    struct Serialize<RawArrayBuf> {
        static void serialize(const RawArrayBuf &array, Serializer &s) {s.writeRawArray(array.asArray());}
    };
    template <>
    struct Deserialize<RawArrayBuf> {
        static RawArrayBuf deserialize(Deserializer &d) {
            RawArrayBuf array;
            d.readArray([&](size_t, Deserializer &item) {
                array.push(item.readBson());
            });
            return array;
        }
    };

    // The borrowed views serialize only; deserializing needs an owned buffer.
    template <>
    struct Serialize<RawDocument> {
        static void serialize(RawDocument doc, Serializer &s)  {s.writeRawDocument(doc);}
    };
    template <>
    struct Serialize<RawArray> {
        static void serialize(RawArray array, Serializer &s)   {s.writeRawArray(array);}
    };


#pragma mark - WRAPPERS:


    template <class T>
    struct Serialize<HumanReadable<T>> {
        static void serialize(const HumanReadable<T> &h, Serializer &s) {
            s.serializeNewtype(kHumanReadableNewtype, [&] {s.write(h.value);});
        }
    };
    template <class T>
    struct Deserialize<HumanReadable<T>> {
        static HumanReadable<T> deserialize(Deserializer &d) {
            return d.deserializeNewtype(kHumanReadableNewtype, [&] {
                return HumanReadable<T>{d.read<T>()};
            });
        }
    };


    template <class T>
    struct Serialize<Utf8Lossy<T>> {
        static void serialize(const Utf8Lossy<T> &u, Serializer &s) {s.write(u.value);}
    };
    template <class T>
    struct Deserialize<Utf8Lossy<T>> {
        static Utf8Lossy<T> deserialize(Deserializer &d) {
            return d.deserializeNewtype(kUtf8LossyNewtype, [&] {
                return Utf8Lossy<T>{d.read<T>()};
            });
        }
    };


#pragma mark - ENTRY POINTS:


    /// Serializes a value to a Bson value.
    template <class T>
    Bson serializeToBson(const T &value, SerializerOptions options ={}) {
        BsonSerializer s(options);
        s.write(value);
        return s.finish();
    }

    /// Serializes a value to a Document. Throws `SerializationError` if the value doesn't
    /// serialize as a document.
    template <class T>
    Document serializeToDocument(const T &value, SerializerOptions options ={}) {
        Bson result = serializeToBson(value, options);
        throwIf(!result.is<Document>(), SerializationError,
                "value serialized as %s, not a document", ElementTypeName(result.type()));
        return std::move(result.as<Document>());
    }

    /// Serializes a value directly to an encoded document.
    template <class T>
    RawDocumentBuf serializeToRawDocumentBuf(const T &value, SerializerOptions options ={}) {
        RawSerializer s(options);
        s.write(value);
        return s.finish();
    }

    /// Serializes a value directly to encoded bytes.
    template <class T>
    std::vector<uint8_t> serializeToVec(const T &value, SerializerOptions options ={}) {
        return serializeToRawDocumentBuf(value, options).extract();
    }

    template <class T>
    T deserializeFromBson(const Bson &value, DeserializerOptions options ={}) {
        BsonDeserializer d(value, options);
        return d.read<T>();
    }

    template <class T>
    T deserializeFromDocument(const Document &doc, DeserializerOptions options ={}) {
        return deserializeFromBson<T>(Bson(doc), options);
    }

    template <class T>
    T deserializeFromRawDocument(RawDocument doc, DeserializerOptions options ={}) {
        RawDeserializer d(doc, options);
        return d.read<T>();
    }

    /// Deserializes encoded bytes, which must be exactly one document.
    template <class T>
    T deserializeFromSlice(slice bytes, DeserializerOptions options ={}) {
        return deserializeFromRawDocument<T>(RawDocument::fromBytes(bytes), options);
    }

}
