//
// Bson.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Bson.hh"
#include "RawDocumentBuf.hh"
#include "BosonException.hh"
#include "Writer.hh"
#include <algorithm>

namespace boson {
    using namespace std;


#pragma mark - DOCUMENT:


    Document::Document() noexcept = default;
    Document::Document(const Document&) = default;
    Document::Document(Document&&) noexcept = default;
    Document& Document::operator= (const Document&) = default;
    Document& Document::operator= (Document&&) noexcept = default;
    Document::~Document() = default;


    Document::Document(initializer_list<Entry> entries) {
        _entries.reserve(entries.size());
        for (auto &entry : entries)
            insert(entry.first, entry.second);
    }


    const Bson* Document::get(string_view key) const noexcept {
        for (auto &entry : _entries) {
            if (entry.first == key)
                return &entry.second;
        }
        return nullptr;
    }


    Bson* Document::get(string_view key) noexcept {
        return const_cast<Bson*>(const_cast<const Document*>(this)->get(key));
    }


    optional<Bson> Document::insert(string key, Bson value) {
        if (Bson *existing = get(key); existing) {
            optional<Bson> old = std::move(*existing);
            *existing = std::move(value);
            return old;
        }
        _entries.emplace_back(std::move(key), std::move(value));
        return nullopt;
    }


    optional<Bson> Document::remove(string_view key) {
        auto i = find_if(_entries.begin(), _entries.end(),
                         [&](const Entry &entry) {return entry.first == key;});
        if (i == _entries.end())
            return nullopt;
        optional<Bson> old = std::move(i->second);
        _entries.erase(i);
        return old;
    }


    void internal::failDocumentAccess(string_view key, const Bson *value, ElementType expected) {
        string keyStr(key);
        BosonException x = value
            ? BosonException(ValueAccessUnexpectedType,
                             "value of key \"" + keyStr + "\" is " + ElementTypeName(value->type())
                             + ", not " + ElementTypeName(expected))
            : BosonException(ValueAccessNotPresent, "key \"" + keyStr + "\" not found");
        x.key = keyStr;
        throw x;
    }


    const string& Document::getStr(string_view key) const       {return getAs<string>(key);}
    double Document::getDouble(string_view key) const           {return getAs<double>(key);}
    int32_t Document::getInt32(string_view key) const           {return getAs<int32_t>(key);}
    int64_t Document::getInt64(string_view key) const           {return getAs<int64_t>(key);}
    bool Document::getBool(string_view key) const               {return getAs<bool>(key);}
    const Document& Document::getDocument(string_view key) const {return getAs<Document>(key);}
    const Array& Document::getArray(string_view key) const      {return getAs<Array>(key);}
    const ObjectId& Document::getObjectId(string_view key) const {return getAs<ObjectId>(key);}
    DateTime Document::getDateTime(string_view key) const       {return getAs<DateTime>(key);}
    Timestamp Document::getTimestamp(string_view key) const     {return getAs<Timestamp>(key);}
    const Binary& Document::getBinary(string_view key) const    {return getAs<Binary>(key);}
    const Regex& Document::getRegex(string_view key) const      {return getAs<Regex>(key);}
    const Decimal128& Document::getDecimal128(string_view key) const {return getAs<Decimal128>(key);}

    bool Document::isNull(string_view key) const {
        const Bson *value = get(key);
        return value && value->isNull();
    }


    bool Document::operator== (const Document &d) const {
        return _entries == d._entries;
    }


    void Document::writeTo(Writer &out, unsigned depth) const {
        throwIf(depth > kMaxNestingDepth, DepthLimitExceeded,
                "documents nested more than %u deep", kMaxNestingDepth);
        size_t start = out.beginLengthPrefix();
        for (auto &entry : _entries) {
            out.writeByte(uint8_t(entry.second.type()));
            out.writeCString(entry.first);
            entry.second.writeTo(out, depth + 1);
        }
        out.writeByte(0);
        out.endLengthPrefix(start);
    }


    RawDocumentBuf Document::toRaw() const {
        return RawDocumentBuf::fromBytes(encode());
    }


    vector<uint8_t> Document::encode() const {
        Writer out;
        writeTo(out);
        return out.finish();
    }


    Document Document::fromRaw(RawDocument raw, unsigned depth) {
        throwIf(depth > kMaxNestingDepth, DepthLimitExceeded,
                "documents nested more than %u deep", kMaxNestingDepth);
        Document doc;
        for (auto &elem : raw) {
            try {
                doc.insert(string(elem.key()), Bson::fromRaw(elem.value(), depth + 1));
            } catch (BosonException &x) {
                if (x.key.empty())
                    x.key = string(elem.key());
                throw;
            }
        }
        return doc;
    }


    Document Document::decode(slice data) {
        return fromRaw(RawDocument::fromBytes(data));
    }


#pragma mark - BSON:


    void Bson::failType(ElementType expected) const {
        BosonException::_throw(ValueAccessUnexpectedType, "value is %s, not %s",
                               ElementTypeName(type()), ElementTypeName(expected));
    }


    static Array arrayFromRaw(RawArray raw, unsigned depth) {
        throwIf(depth > kMaxNestingDepth, DepthLimitExceeded,
                "arrays nested more than %u deep", kMaxNestingDepth);
        Array array;
        for (RawArrayIter i(raw); i; ++i)
            array.push_back(Bson::fromRaw(*i, depth + 1));
        return array;
    }


    Bson Bson::fromRaw(const RawBsonRef &raw, unsigned depth) {
        switch (raw.type()) {
            case ElementType::Double:
                return raw.asDouble();
            case ElementType::String:
                return string(raw.asStr());
            case ElementType::EmbeddedDocument:
                return Document::fromRaw(raw.asDocument(), depth);
            case ElementType::Array:
                return arrayFromRaw(raw.asArray(), depth);
            case ElementType::Binary:
                return raw.asBinary().toBinary();
            case ElementType::Undefined:
                return Undefined();
            case ElementType::ObjectId:
                return raw.asObjectId();
            case ElementType::Boolean:
                return raw.asBool();
            case ElementType::DateTime:
                return raw.asDateTime();
            case ElementType::Null:
                return Null();
            case ElementType::RegularExpression: {
                auto regex = raw.asRegex();
                return Regex(string(regex.pattern), string(regex.options));
            }
            case ElementType::DbPointer: {
                auto ptr = raw.asDbPointer();
                return DbPointer{string(ptr.namespace_), ptr.id};
            }
            case ElementType::JavaScriptCode:
                return JavaScriptCode{string(raw.asJavaScriptCode())};
            case ElementType::Symbol:
                return Symbol{string(raw.asSymbol())};
            case ElementType::JavaScriptCodeWithScope: {
                auto cws = raw.asJavaScriptCodeWithScope();
                return JavaScriptCodeWithScope{string(cws.code),
                                               Document::fromRaw(cws.scope, depth + 1)};
            }
            case ElementType::Int32:
                return raw.asInt32();
            case ElementType::Timestamp:
                return raw.asTimestamp();
            case ElementType::Int64:
                return raw.asInt64();
            case ElementType::Decimal128:
                return raw.asDecimal128();
            case ElementType::MinKey:
                return MinKey();
            case ElementType::MaxKey:
                return MaxKey();
        }
        BosonException::_throw(InternalError, "unhandled element type");
    }


    void Bson::writeTo(Writer &out, unsigned depth) const {
        switch (type()) {
            case ElementType::String:
                out.writeString(std::get<string>(_value));
                break;
            case ElementType::EmbeddedDocument:
                std::get<Document>(_value).writeTo(out, depth);
                break;
            case ElementType::Array: {
                throwIf(depth > kMaxNestingDepth, DepthLimitExceeded,
                        "arrays nested more than %u deep", kMaxNestingDepth);
                size_t start = out.beginLengthPrefix();
                size_t index = 0;
                for (auto &item : std::get<Array>(_value)) {
                    out.writeByte(uint8_t(item.type()));
                    out.writeCString(to_string(index++));
                    item.writeTo(out, depth + 1);
                }
                out.writeByte(0);
                out.endLengthPrefix(start);
                break;
            }
            case ElementType::Binary: {
                auto &bin = std::get<Binary>(_value);
                RawBsonRef(RawBinaryRef{bin.subtype, bin.asSlice()}).writeTo(out);
                break;
            }
            case ElementType::RegularExpression: {
                auto &regex = std::get<Regex>(_value);
                RawBsonRef(RawRegexRef{regex.pattern, regex.options}).writeTo(out);
                break;
            }
            case ElementType::DbPointer: {
                auto &ptr = std::get<DbPointer>(_value);
                RawBsonRef(RawDbPointerRef{ptr.namespace_, ptr.id}).writeTo(out);
                break;
            }
            case ElementType::JavaScriptCode:
                out.writeString(std::get<JavaScriptCode>(_value).code);
                break;
            case ElementType::Symbol:
                out.writeString(std::get<Symbol>(_value).symbol);
                break;
            case ElementType::JavaScriptCodeWithScope: {
                auto &cws = std::get<JavaScriptCodeWithScope>(_value);
                size_t start = out.beginLengthPrefix();
                out.writeString(cws.code);
                cws.scope.writeTo(out, depth + 1);
                out.endLengthPrefix(start);
                break;
            }
            case ElementType::Double:
                out.writeDouble(std::get<double>(_value));
                break;
            case ElementType::ObjectId:
                out.write(std::get<ObjectId>(_value).asSlice());
                break;
            case ElementType::Boolean:
                out.writeByte(std::get<bool>(_value) ? 1 : 0);
                break;
            case ElementType::DateTime:
                out.writeInt64(std::get<DateTime>(_value).timestampMillis());
                break;
            case ElementType::Int32:
                out.writeInt32(std::get<int32_t>(_value));
                break;
            case ElementType::Timestamp:
                RawBsonRef(std::get<Timestamp>(_value)).writeTo(out);
                break;
            case ElementType::Int64:
                out.writeInt64(std::get<int64_t>(_value));
                break;
            case ElementType::Decimal128:
                out.write(std::get<Decimal128>(_value).asSlice());
                break;
            case ElementType::Null:
            case ElementType::Undefined:
            case ElementType::MinKey:
            case ElementType::MaxKey:
                break;
        }
    }

}
