//
// RawBsonRef.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RawBsonRef.hh"
#include "BosonException.hh"
#include "Writer.hh"

namespace boson {
    using namespace std;


    void RawBsonRef::failType(ElementType expected) const {
        BosonException::_throw(ValueAccessUnexpectedType, "value is %s, not %s",
                               ElementTypeName(_type), ElementTypeName(expected));
    }


    void RawBsonRef::writeTo(Writer &out) const {
        switch (_type) {
            case ElementType::Double:
                out.writeDouble(std::get<double>(_value));
                break;
            case ElementType::String:
            case ElementType::JavaScriptCode:
            case ElementType::Symbol:
                out.writeString(std::get<string_view>(_value));
                break;
            case ElementType::EmbeddedDocument:
                out.write(std::get<RawDocument>(_value).data());
                break;
            case ElementType::Array:
                out.write(std::get<RawArray>(_value).data());
                break;
            case ElementType::Binary: {
                auto &bin = std::get<RawBinaryRef>(_value);
                bool old = (bin.subtype == BinarySubtype::BinaryOld);
                size_t length = bin.bytes.size + (old ? 4 : 0);
                throwIf(length > kMaxDocumentSize - 16, MalformedValue, "binary data is too long");
                out.writeInt32(int32_t(length));
                out.writeByte(uint8_t(bin.subtype));
                if (old)
                    out.writeInt32(int32_t(bin.bytes.size));
                out.write(bin.bytes);
                break;
            }
            case ElementType::ObjectId:
                out.write(std::get<ObjectId>(_value).asSlice());
                break;
            case ElementType::Boolean:
                out.writeByte(std::get<bool>(_value) ? 1 : 0);
                break;
            case ElementType::DateTime:
                out.writeInt64(std::get<DateTime>(_value).timestampMillis());
                break;
            case ElementType::RegularExpression: {
                auto &regex = std::get<RawRegexRef>(_value);
                out.writeCString(regex.pattern);
                out.writeCString(regex.options);
                break;
            }
            case ElementType::DbPointer: {
                auto &ptr = std::get<RawDbPointerRef>(_value);
                out.writeString(ptr.namespace_);
                out.write(ptr.id.asSlice());
                break;
            }
            case ElementType::JavaScriptCodeWithScope: {
                auto &cws = std::get<RawJavaScriptCodeWithScopeRef>(_value);
                size_t pos = out.beginLengthPrefix();
                out.writeString(cws.code);
                out.write(cws.scope.data());
                out.endLengthPrefix(pos);
                break;
            }
            case ElementType::Int32:
                out.writeInt32(std::get<int32_t>(_value));
                break;
            case ElementType::Timestamp: {
                auto ts = std::get<Timestamp>(_value);
                out.writeUInt32(ts.increment);
                out.writeUInt32(ts.time);
                break;
            }
            case ElementType::Int64:
                out.writeInt64(std::get<int64_t>(_value));
                break;
            case ElementType::Decimal128:
                out.write(std::get<Decimal128>(_value).asSlice());
                break;
            case ElementType::Undefined:
            case ElementType::Null:
            case ElementType::MinKey:
            case ElementType::MaxKey:
                break;
        }
    }


    void RawBsonRef::writeElement(Writer &out, string_view key) const {
        out.writeByte(uint8_t(_type));
        out.writeCString(key);
        writeTo(out);
    }


#pragma mark - ARRAY ITERATOR:


    void RawArrayIter::readValue() {
        if (_iter)
            _value = _iter->value();
        else
            _value = nullopt;
    }


    RawArrayIter& RawArrayIter::operator++ () {
        ++_iter;
        ++_index;
        readValue();
        return *this;
    }

}
