//
// RawArray.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RawArray.hh"
#include "RawBsonRef.hh"
#include "BosonException.hh"

namespace boson {
    using namespace std;


    RawArrayIter RawArray::begin() const {
        return RawArrayIter(*this);
    }


    size_t RawArray::count() const {
        size_t n = 0;
        for (RawIter i(_doc); i; ++i)
            ++n;
        return n;
    }


    optional<RawBsonRef> RawArray::get(size_t index) const {
        size_t n = 0;
        for (RawIter i(_doc); i; ++i) {
            if (n++ == index)
                return i->value();
        }
        return nullopt;
    }


    RawBsonRef RawArray::getTyped(size_t index, ElementType type) const {
        optional<RawBsonRef> value = get(index);
        if (!value)
            BosonException::_throw(ValueAccessNotPresent, "array index %zu out of range", index);
        if (value->type() != type)
            BosonException::_throw(ValueAccessUnexpectedType, "array item %zu is %s, not %s",
                                   index, ElementTypeName(value->type()), ElementTypeName(type));
        return *value;
    }


    double RawArray::getDouble(size_t i) const {
        return getTyped(i, ElementType::Double).asDouble();
    }
    string_view RawArray::getStr(size_t i) const {
        return getTyped(i, ElementType::String).asStr();
    }
    RawDocument RawArray::getDocument(size_t i) const {
        return getTyped(i, ElementType::EmbeddedDocument).asDocument();
    }
    RawArray RawArray::getArray(size_t i) const {
        return getTyped(i, ElementType::Array).asArray();
    }
    RawBinaryRef RawArray::getBinary(size_t i) const {
        return getTyped(i, ElementType::Binary).asBinary();
    }
    ObjectId RawArray::getObjectId(size_t i) const {
        return getTyped(i, ElementType::ObjectId).asObjectId();
    }
    bool RawArray::getBool(size_t i) const {
        return getTyped(i, ElementType::Boolean).asBool();
    }
    DateTime RawArray::getDateTime(size_t i) const {
        return getTyped(i, ElementType::DateTime).asDateTime();
    }
    RawRegexRef RawArray::getRegex(size_t i) const {
        return getTyped(i, ElementType::RegularExpression).asRegex();
    }
    Timestamp RawArray::getTimestamp(size_t i) const {
        return getTyped(i, ElementType::Timestamp).asTimestamp();
    }
    int32_t RawArray::getInt32(size_t i) const {
        return getTyped(i, ElementType::Int32).asInt32();
    }
    int64_t RawArray::getInt64(size_t i) const {
        return getTyped(i, ElementType::Int64).asInt64();
    }
    Decimal128 RawArray::getDecimal128(size_t i) const {
        return getTyped(i, ElementType::Decimal128).asDecimal128();
    }

}
