//
// Serializer.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Serializer.hh"

namespace boson {
    using namespace std;


#pragma mark - SERIALIZER:


    void Serializer::beginDocument() {
        throwIf(_depth >= kMaxNestingDepth, DepthLimitExceeded,
                "documents nested more than %u deep", kMaxNestingDepth);
        _beginDocument();
        ++_depth;
    }


    void Serializer::endDocument() {
        throwIf(_depth == 0, SerializationError, "endDocument without beginDocument");
        _endDocument();
        --_depth;
    }


    void Serializer::beginArray() {
        throwIf(_depth >= kMaxNestingDepth, DepthLimitExceeded,
                "arrays nested more than %u deep", kMaxNestingDepth);
        _beginArray();
        ++_depth;
    }


    void Serializer::endArray() {
        throwIf(_depth == 0, SerializationError, "endArray without beginArray");
        _endArray();
        --_depth;
    }


    void Serializer::writeDocument(const Document &doc) {
        beginDocument();
        for (auto &entry : doc) {
            writeKey(entry.first);
            withPathKey(entry.first, [&] {writeBson(entry.second);});
        }
        endDocument();
    }


    void Serializer::writeBson(const Bson &value) {
        switch (value.type()) {
            case ElementType::Double:
                writeDouble(value.as<double>());
                break;
            case ElementType::String:
                writeString(value.as<string>());
                break;
            case ElementType::EmbeddedDocument:
                writeDocument(value.as<Document>());
                break;
            case ElementType::Array: {
                beginArray();
                size_t index = 0;
                for (auto &item : value.as<Array>()) {
                    withPathIndex(index++, [&] {writeBson(item);});
                }
                endArray();
                break;
            }
            case ElementType::Binary: {
                auto &bin = value.as<Binary>();
                writeBinary(bin.subtype, bin.asSlice());
                break;
            }
            case ElementType::Undefined:
                writeUndefined();
                break;
            case ElementType::ObjectId:
                writeObjectId(value.as<ObjectId>());
                break;
            case ElementType::Boolean:
                writeBool(value.as<bool>());
                break;
            case ElementType::DateTime:
                writeDateTime(value.as<DateTime>());
                break;
            case ElementType::Null:
                writeNull();
                break;
            case ElementType::RegularExpression: {
                auto &regex = value.as<Regex>();
                writeRegex(regex.pattern, regex.options);
                break;
            }
            case ElementType::DbPointer: {
                auto &ptr = value.as<DbPointer>();
                writeDbPointer(ptr.namespace_, ptr.id);
                break;
            }
            case ElementType::JavaScriptCode:
                writeJavaScriptCode(value.as<JavaScriptCode>().code);
                break;
            case ElementType::Symbol:
                writeSymbol(value.as<Symbol>().symbol);
                break;
            case ElementType::JavaScriptCodeWithScope: {
                auto &cws = value.as<JavaScriptCodeWithScope>();
                writeJavaScriptCodeWithScope(cws.code, cws.scope);
                break;
            }
            case ElementType::Int32:
                writeInt32(value.as<int32_t>());
                break;
            case ElementType::Timestamp:
                writeTimestamp(value.as<Timestamp>());
                break;
            case ElementType::Int64:
                writeInt64(value.as<int64_t>());
                break;
            case ElementType::Decimal128:
                writeDecimal128(value.as<Decimal128>());
                break;
            case ElementType::MinKey:
                writeMinKey();
                break;
            case ElementType::MaxKey:
                writeMaxKey();
                break;
        }
    }


#pragma mark - BSON SERIALIZER:


    void BsonSerializer::emit(Bson value) {
        if (_stack.empty()) {
            throwIf(_result.has_value(), SerializationError, "more than one top-level value");
            _result = std::move(value);
            return;
        }
        Frame &top = _stack.back();
        if (top.isArray) {
            top.array.push_back(std::move(value));
        } else {
            throwIf(!top.key, SerializationError, "document value written without a key");
            top.doc.insert(std::move(*top.key), std::move(value));
            top.key.reset();
        }
    }


    void BsonSerializer::writeRegex(string_view pattern, string_view options) {
        throwIf(pattern.find('\0') != string_view::npos || options.find('\0') != string_view::npos,
                InvalidCString, "regex contains a NUL byte");
        emit(Regex(string(pattern), string(options)));
    }


    void BsonSerializer::writeRawDocument(RawDocument doc) {
        emit(Document::fromRaw(doc));
    }


    void BsonSerializer::writeRawArray(RawArray array) {
        emit(Bson::fromRaw(array));
    }


    void BsonSerializer::writeKey(string_view key) {
        throwIf(_stack.empty() || _stack.back().isArray, SerializationError,
                "key \"%.*s\" written outside a document", FMTSLICE(slice(key)));
        throwIf(_stack.back().key.has_value(), SerializationError,
                "key \"%.*s\" written while another key is awaiting its value",
                FMTSLICE(slice(key)));
        throwIf(key.find('\0') != string_view::npos, InvalidCString, "key contains a NUL byte");
        _stack.back().key = string(key);
    }


    void BsonSerializer::_beginDocument() {
        _stack.push_back({false, {}, {}, nullopt});
    }


    void BsonSerializer::_endDocument() {
        throwIf(_stack.empty() || _stack.back().isArray, SerializationError,
                "endDocument doesn't match beginDocument");
        throwIf(_stack.back().key.has_value(), SerializationError, "key without a value");
        Document doc = std::move(_stack.back().doc);
        _stack.pop_back();
        emit(std::move(doc));
    }


    void BsonSerializer::_beginArray() {
        _stack.push_back({true, {}, {}, nullopt});
    }


    void BsonSerializer::_endArray() {
        throwIf(_stack.empty() || !_stack.back().isArray, SerializationError,
                "endArray doesn't match beginArray");
        Array array = std::move(_stack.back().array);
        _stack.pop_back();
        emit(std::move(array));
    }


    Bson BsonSerializer::finish() {
        throwIf(!_stack.empty(), SerializationError, "unclosed document or array");
        throwIf(!_result, SerializationError, "no value was written");
        Bson result = std::move(*_result);
        _result.reset();
        return result;
    }


#pragma mark - RAW SERIALIZER:


    // Writes the type tag and key of the next element. At top level only a document is allowed.
    void RawSerializer::beginElement(ElementType type) {
        throwIf(_finished, SerializationError, "more than one top-level value");
        if (_stack.empty()) {
            if (type != ElementType::EmbeddedDocument)
                BosonException::_throw(SerializationError,
                                       "top-level value must be a document, not %s",
                                       ElementTypeName(type));
            return;
        }
        Frame &top = _stack.back();
        if (top.isArray) {
            _out.writeByte(uint8_t(type));
            _out.writeCString(to_string(top.count++));
        } else {
            throwIf(!top.key, SerializationError, "document value written without a key");
            _out.writeByte(uint8_t(type));
            _out.writeCString(*top.key);
            top.key.reset();
        }
    }


    void RawSerializer::writeScalar(const RawBsonRef &value) {
        beginElement(value.type());
        value.writeTo(_out);
    }


    void RawSerializer::writeNull()                     {writeScalar(Null());}
    void RawSerializer::writeUndefined()                {writeScalar(Undefined());}
    void RawSerializer::writeMinKey()                   {writeScalar(MinKey());}
    void RawSerializer::writeMaxKey()                   {writeScalar(MaxKey());}
    void RawSerializer::writeBool(bool b)               {writeScalar(b);}
    void RawSerializer::writeInt32(int32_t i)           {writeScalar(i);}
    void RawSerializer::writeInt64(int64_t i)           {writeScalar(i);}
    void RawSerializer::writeDouble(double d)           {writeScalar(d);}
    void RawSerializer::writeString(string_view s)      {writeScalar(s);}
    void RawSerializer::writeObjectId(const ObjectId &o) {writeScalar(o);}
    void RawSerializer::writeDateTime(DateTime d)       {writeScalar(d);}
    void RawSerializer::writeTimestamp(Timestamp t)     {writeScalar(t);}
    void RawSerializer::writeDecimal128(const Decimal128 &d) {writeScalar(d);}

    void RawSerializer::writeBinary(BinarySubtype subtype, slice bytes) {
        writeScalar(RawBinaryRef{subtype, bytes});
    }

    void RawSerializer::writeRegex(string_view pattern, string_view options) {
        writeScalar(RawRegexRef{pattern, options});
    }

    void RawSerializer::writeJavaScriptCode(string_view code) {
        writeScalar(RawBsonRef::javaScriptCode(code));
    }

    void RawSerializer::writeSymbol(string_view symbol) {
        writeScalar(RawBsonRef::symbol(symbol));
    }

    void RawSerializer::writeDbPointer(string_view ns, const ObjectId &id) {
        writeScalar(RawDbPointerRef{ns, id});
    }

    void RawSerializer::writeJavaScriptCodeWithScope(string_view code, const Document &scope) {
        beginElement(ElementType::JavaScriptCodeWithScope);
        size_t start = _out.beginLengthPrefix();
        _out.writeString(code);
        scope.writeTo(_out, depth() + 1);
        _out.endLengthPrefix(start);
    }


    void RawSerializer::writeRawDocument(RawDocument doc) {
        if (_stack.empty()) {
            beginElement(ElementType::EmbeddedDocument);
            _out.write(doc.data());
            _finished = true;
        } else {
            writeScalar(doc);
        }
    }


    void RawSerializer::writeRawArray(RawArray array) {
        writeScalar(array);
    }


    void RawSerializer::writeKey(string_view key) {
        throwIf(_stack.empty() || _stack.back().isArray, SerializationError,
                "key \"%.*s\" written outside a document", FMTSLICE(slice(key)));
        throwIf(_stack.back().key.has_value(), SerializationError,
                "key \"%.*s\" written while another key is awaiting its value",
                FMTSLICE(slice(key)));
        throwIf(key.find('\0') != string_view::npos, InvalidCString, "key contains a NUL byte");
        _stack.back().key = string(key);
    }


    void RawSerializer::_beginDocument() {
        beginElement(ElementType::EmbeddedDocument);
        _stack.push_back({_out.beginLengthPrefix(), false, 0, nullopt});
    }


    void RawSerializer::_endDocument() {
        throwIf(_stack.empty() || _stack.back().isArray, SerializationError,
                "endDocument doesn't match beginDocument");
        throwIf(_stack.back().key.has_value(), SerializationError, "key without a value");
        _out.writeByte(0);
        _out.endLengthPrefix(_stack.back().start);
        _stack.pop_back();
        if (_stack.empty())
            _finished = true;
    }


    void RawSerializer::_beginArray() {
        beginElement(ElementType::Array);
        _stack.push_back({_out.beginLengthPrefix(), true, 0, nullopt});
    }


    void RawSerializer::_endArray() {
        throwIf(_stack.empty() || !_stack.back().isArray, SerializationError,
                "endArray doesn't match beginArray");
        _out.writeByte(0);
        _out.endLengthPrefix(_stack.back().start);
        _stack.pop_back();
    }


    RawDocumentBuf RawSerializer::finish() {
        throwIf(!_finished || !_stack.empty(), SerializationError, "document is incomplete");
        _finished = false;
        return RawDocumentBuf::fromBytes(_out.finish());
    }

}
