//
// RawDocument.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RawDocument.hh"
#include "RawBsonRef.hh"
#include "BosonException.hh"
#include "Endian.hh"
#include "UTF8.hh"
#include "slice_stream.hh"
#include "betterassert.hh"

namespace boson {
    using namespace std;


    static const uint8_t kEmptyDocument[kMinDocumentSize] = {5, 0, 0, 0, 0};


    RawDocument::RawDocument() noexcept
    :_data(kEmptyDocument, kMinDocumentSize)
    { }


    RawDocument RawDocument::fromBytes(slice data) {
        if (_usuallyFalse(data.size < kMinDocumentSize))
            BosonException::_throwAt(MalformedValue, 0,
                                     "document is only %zu bytes long", data.size);
        int32_t length = endian::decodeLittle<int32_t>(data.buf);
        if (_usuallyFalse(length < 0 || size_t(length) != data.size))
            BosonException::_throwAt(MalformedValue, 0,
                                     "document length prefix %d doesn't match its size %zu",
                                     length, data.size);
        if (_usuallyFalse(data[data.size - 1] != 0))
            BosonException::_throwAt(MalformedValue, data.size - 1,
                                     "document is not terminated by a 0 byte");
        return RawDocument(data);
    }


    optional<RawBsonRef> RawDocument::get(string_view key) const {
        for (RawIter i(*this); i; ++i) {
            if (i->key() == key)
                return i->value();
        }
        return nullopt;
    }


    bool RawDocument::contains(string_view key) const {
        for (RawIter i(*this); i; ++i) {
            if (i->key() == key)
                return true;
        }
        return false;
    }


#pragma mark - TYPED GETTERS:


    RawBsonRef RawDocument::getTyped(string_view key, ElementType type) const {
        optional<RawBsonRef> value = get(key);
        if (!value) {
            BosonException x(ValueAccessNotPresent,
                             "key \"" + string(key) + "\" not found");
            x.key = string(key);
            throw x;
        }
        if (value->type() != type) {
            BosonException x(ValueAccessUnexpectedType,
                             "value of key \"" + string(key) + "\" is "
                             + ElementTypeName(value->type()) + ", not " + ElementTypeName(type));
            x.key = string(key);
            throw x;
        }
        return *value;
    }

    double RawDocument::getDouble(string_view key) const {
        return getTyped(key, ElementType::Double).asDouble();
    }
    string_view RawDocument::getStr(string_view key) const {
        return getTyped(key, ElementType::String).asStr();
    }
    RawDocument RawDocument::getDocument(string_view key) const {
        return getTyped(key, ElementType::EmbeddedDocument).asDocument();
    }
    RawArray RawDocument::getArray(string_view key) const {
        return getTyped(key, ElementType::Array).asArray();
    }
    RawBinaryRef RawDocument::getBinary(string_view key) const {
        return getTyped(key, ElementType::Binary).asBinary();
    }
    ObjectId RawDocument::getObjectId(string_view key) const {
        return getTyped(key, ElementType::ObjectId).asObjectId();
    }
    bool RawDocument::getBool(string_view key) const {
        return getTyped(key, ElementType::Boolean).asBool();
    }
    DateTime RawDocument::getDateTime(string_view key) const {
        return getTyped(key, ElementType::DateTime).asDateTime();
    }
    RawRegexRef RawDocument::getRegex(string_view key) const {
        return getTyped(key, ElementType::RegularExpression).asRegex();
    }
    Timestamp RawDocument::getTimestamp(string_view key) const {
        return getTyped(key, ElementType::Timestamp).asTimestamp();
    }
    int32_t RawDocument::getInt32(string_view key) const {
        return getTyped(key, ElementType::Int32).asInt32();
    }
    int64_t RawDocument::getInt64(string_view key) const {
        return getTyped(key, ElementType::Int64).asInt64();
    }
    Decimal128 RawDocument::getDecimal128(string_view key) const {
        return getTyped(key, ElementType::Decimal128).asDecimal128();
    }

    bool RawDocument::isNull(string_view key) const {
        optional<RawBsonRef> value = get(key);
        return value && value->type() == ElementType::Null;
    }


#pragma mark - ITERATOR:


    // Reads an int32 length field. `base` is the stream's offset in the document.
    static int32_t readLength(slice_istream &in, size_t base) {
        uint8_t buf[4];
        if (!in.readAll(buf, sizeof(buf)))
            BosonException::_throwAt(MalformedValue, base + in.position(),
                                     "length field runs past end of document");
        return endian::decodeLittle<int32_t>(buf);
    }


    // Returns the number of bytes of the value of an element of the given type, which starts at
    // the current position of `in`. Only checks what's needed to find the value's extent.
    static size_t valueLength(ElementType type, slice_istream &in, size_t base) {
        switch (type) {
            case ElementType::Undefined:
            case ElementType::Null:
            case ElementType::MinKey:
            case ElementType::MaxKey:
                return 0;
            case ElementType::Boolean:
                return 1;
            case ElementType::Int32:
                return 4;
            case ElementType::Double:
            case ElementType::DateTime:
            case ElementType::Timestamp:
            case ElementType::Int64:
                return 8;
            case ElementType::ObjectId:
                return 12;
            case ElementType::Decimal128:
                return 16;
            case ElementType::String:
            case ElementType::JavaScriptCode:
            case ElementType::Symbol: {
                int32_t n = readLength(in, base);
                if (n < 1)
                    BosonException::_throwAt(MalformedValue, base, "invalid string length %d", n);
                return 4 + size_t(n);
            }
            case ElementType::EmbeddedDocument:
            case ElementType::Array: {
                int32_t n = readLength(in, base);
                if (n < int32_t(kMinDocumentSize))
                    BosonException::_throwAt(MalformedValue, base, "invalid document length %d", n);
                return size_t(n);
            }
            case ElementType::Binary: {
                int32_t n = readLength(in, base);
                if (n < 0)
                    BosonException::_throwAt(MalformedValue, base, "invalid binary length %d", n);
                return 5 + size_t(n);
            }
            case ElementType::RegularExpression: {
                slice pattern = in.readToDelimiter(0);
                slice options = pattern ? in.readToDelimiter(0) : nullslice;
                if (!options)
                    BosonException::_throwAt(MalformedValue, base, "unterminated regex");
                return pattern.size + 1 + options.size + 1;
            }
            case ElementType::DbPointer: {
                int32_t n = readLength(in, base);
                if (n < 1)
                    BosonException::_throwAt(MalformedValue, base, "invalid string length %d", n);
                return 4 + size_t(n) + ObjectId::kSize;
            }
            case ElementType::JavaScriptCodeWithScope: {
                int32_t n = readLength(in, base);
                if (n < 14)
                    BosonException::_throwAt(MalformedValue, base,
                                             "invalid code-with-scope length %d", n);
                return size_t(n);
            }
        }
        BosonException::_throwAt(InternalError, base, "unhandled element type");
    }


    RawIter::RawIter(RawDocument doc, bool lossyKeys)
    :_data(doc.data())
    ,_pos(4)
    ,_lossyKeys(lossyKeys)
    {
        readNext();
    }


    RawIter& RawIter::operator++ () {
        throwIf(_done, OutOfRange, "iterating past end of document");
        readNext();
        return *this;
    }


    void RawIter::readNext() {
        // Stay at the end if anything below throws:
        _done = true;
        const size_t bodyEnd = _data.size - 1;          // offset of the terminating 0
        if (_pos >= bodyEnd)
            return;

        const size_t start = _pos;
        slice_istream in(slice(_data.begin() + start, _data.begin() + bodyEnd));

        uint8_t tag = in.readByte();
        if (tag == 0)
            BosonException::_throwAt(MalformedValue, start, "unexpected 0 byte inside document");
        optional<ElementType> type = ElementTypeFromByte(tag);
        if (!type)
            BosonException::_throwAt(UnknownElementType, start,
                                     "unknown element type 0x%02x", tag);

        slice key = in.readToDelimiter(0);
        if (!key)
            BosonException::_throwAt(MalformedValue, start, "unterminated key");
        if (!_lossyKeys && !IsValidUTF8(key))
            BosonException::_throwAt(Utf8Encoding, start + 1, "key is not valid UTF-8");

        const size_t valueStart = start + in.position();
        size_t length;
        {
            slice_istream valueIn {slice(in)};
            length = valueLength(*type, valueIn, valueStart);
        }
        if (length > in.bytesRemaining())
            BosonException::_throwAt(MalformedValue, valueStart,
                                     "%s value of length %zu runs past end of document",
                                     ElementTypeName(*type), length);

        _element = RawElement(*type, key, slice(in.buf, length), start);
        _pos = valueStart + length;
        _done = false;
    }


#pragma mark - ELEMENT:


    // Reads a BSON string (int32 length, bytes, NUL) occupying all of `value`, and returns the
    // bytes without the NUL.
    static slice readStringBytes(slice value, size_t offset) {
        if (value.size < 5)
            BosonException::_throwAt(MalformedValue, offset, "string is truncated");
        int32_t n = endian::decodeLittle<int32_t>(value.buf);
        if (n < 1 || size_t(n) != value.size - 4)
            BosonException::_throwAt(MalformedValue, offset,
                                     "string length %d is inconsistent", n);
        if (value[value.size - 1] != 0)
            BosonException::_throwAt(MalformedValue, offset, "string is not NUL-terminated");
        return value(4, value.size - 5);
    }

    static string_view checkedText(slice bytes, size_t offset) {
        if (!IsValidUTF8(bytes))
            BosonException::_throwAt(Utf8Encoding, offset + ValidUTF8Length(bytes),
                                     "string is not valid UTF-8");
        return bytes.asStringView();
    }


    RawBsonRef RawElement::value() const {
        return decode(true);
    }


    RawBsonRef RawElement::valueWithoutUtf8Check() const {
        return decode(false);
    }


    RawBsonRef RawElement::decode(bool checkUtf8) const {
        // Offset of the value within the document:
        const size_t offset = _offset + 1 + _key.size + 1;
        auto text = [checkUtf8](slice bytes, size_t textOffset) {
            return checkUtf8 ? checkedText(bytes, textOffset) : bytes.asStringView();
        };
        try {
            switch (_type) {
                case ElementType::Double:
                    return endian::decodeLittle<double>(_value.buf);
                case ElementType::String:
                    return text(readStringBytes(_value, offset), offset + 4);
                case ElementType::EmbeddedDocument:
                    return RawDocument::fromBytes(_value);
                case ElementType::Array:
                    return RawArray::fromBytes(_value);
                case ElementType::Binary: {
                    auto subtype = BinarySubtype(_value[4]);
                    slice bytes = _value.from(5);
                    if (subtype == BinarySubtype::BinaryOld) {
                        // The old binary subtype has a redundant inner length:
                        if (bytes.size < 4
                                || endian::decodeLittle<int32_t>(bytes.buf) != int32_t(bytes.size - 4))
                            BosonException::_throwAt(MalformedValue, offset,
                                                     "old binary subtype has inconsistent inner length");
                        bytes = bytes.from(4);
                    }
                    return RawBinaryRef{subtype, bytes};
                }
                case ElementType::Undefined:
                    return Undefined();
                case ElementType::ObjectId:
                    return ObjectId::fromBytes(_value);
                case ElementType::Boolean:
                    if (_value[0] > 1)
                        BosonException::_throwAt(MalformedValue, offset,
                                                 "invalid boolean byte 0x%02x", _value[0]);
                    return _value[0] != 0;
                case ElementType::DateTime:
                    return DateTime::fromMillis(endian::decodeLittle<int64_t>(_value.buf));
                case ElementType::Null:
                    return Null();
                case ElementType::RegularExpression: {
                    slice_istream in(_value);
                    slice pattern = in.readToDelimiter(0);
                    slice options = in.readToDelimiter(0);
                    return RawRegexRef{text(pattern, offset),
                                       text(options, offset + pattern.size + 1)};
                }
                case ElementType::DbPointer: {
                    slice str = _value.upTo(_value.size - ObjectId::kSize);
                    slice oid = _value.from(_value.size - ObjectId::kSize);
                    return RawDbPointerRef{text(readStringBytes(str, offset), offset + 4),
                                           ObjectId::fromBytes(oid)};
                }
                case ElementType::JavaScriptCode:
                    return RawBsonRef::javaScriptCode(
                                        text(readStringBytes(_value, offset), offset + 4));
                case ElementType::Symbol:
                    return RawBsonRef::symbol(
                                        text(readStringBytes(_value, offset), offset + 4));
                case ElementType::JavaScriptCodeWithScope: {
                    // int32 total length, string, document:
                    if (_value.size < 14)
                        BosonException::_throwAt(MalformedValue, offset, "code-with-scope is truncated");
                    int32_t strLen = endian::decodeLittle<int32_t>(_value.from(4).buf);
                    if (strLen < 1 || size_t(strLen) + 8 + kMinDocumentSize > _value.size)
                        BosonException::_throwAt(MalformedValue, offset,
                                                 "code-with-scope string length %d is inconsistent",
                                                 strLen);
                    slice code = readStringBytes(_value(4, 4 + size_t(strLen)), offset + 4);
                    RawDocument scope = RawDocument::fromBytes(_value.from(8 + size_t(strLen)));
                    return RawJavaScriptCodeWithScopeRef{text(code, offset + 8), scope};
                }
                case ElementType::Int32:
                    return endian::decodeLittle<int32_t>(_value.buf);
                case ElementType::Timestamp: {
                    // The increment comes first:
                    uint32_t increment = endian::decodeLittle<uint32_t>(_value.buf);
                    uint32_t time = endian::decodeLittle<uint32_t>(_value.from(4).buf);
                    return Timestamp{time, increment};
                }
                case ElementType::Int64:
                    return endian::decodeLittle<int64_t>(_value.buf);
                case ElementType::Decimal128:
                    return Decimal128::fromBytes(_value.buf);
                case ElementType::MinKey:
                    return MinKey();
                case ElementType::MaxKey:
                    return MaxKey();
            }
            BosonException::_throwAt(InternalError, offset, "unhandled element type");
        } catch (BosonException &x) {
            if (x.key.empty())
                x.key = key();
            throw;
        }
    }


    string RawElement::textUtf8Lossy() const {
        const size_t offset = _offset + 1 + _key.size + 1;
        switch (_type) {
            case ElementType::String:
            case ElementType::JavaScriptCode:
            case ElementType::Symbol:
                try {
                    return ReplaceInvalidUTF8(readStringBytes(_value, offset));
                } catch (BosonException &x) {
                    if (x.key.empty())
                        x.key = key();
                    throw;
                }
            default: {
                BosonException x(ValueAccessUnexpectedType,
                                 string("expected a string but found ") + ElementTypeName(_type));
                x.key = key();
                throw x;
            }
        }
    }

}
