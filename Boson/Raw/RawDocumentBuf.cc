//
// RawDocumentBuf.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RawDocumentBuf.hh"
#include "Bson.hh"
#include "BosonException.hh"
#include "Endian.hh"
#include "Writer.hh"
#include "betterassert.hh"

namespace boson {
    using namespace std;


    RawBsonRef::RawBsonRef(const RawDocumentBuf &doc) noexcept
    :RawBsonRef(doc.asDocument())
    { }


    RawDocumentBuf::RawDocumentBuf()
    :_data{uint8_t(kMinDocumentSize), 0, 0, 0, 0}
    { }


    RawDocumentBuf RawDocumentBuf::fromBytes(vector<uint8_t> data) {
        (void)RawDocument::fromBytes(slice(data));     // throws if the header is bad
        RawDocumentBuf doc;
        doc._data = std::move(data);
        return doc;
    }


    void RawDocumentBuf::append(string_view key, RawBsonRef value) {
        Writer element(1 + key.size() + 1 + 16);
        value.writeElement(element, key);
        appendElement(element.output());
    }


    void RawDocumentBuf::append(string_view key, const Bson &value) {
        Writer element;
        element.writeByte(uint8_t(value.type()));
        element.writeCString(key);
        value.writeTo(element);
        appendElement(element.output());
    }


    // Inserts an encoded element before the terminator and updates the length prefix.
    void RawDocumentBuf::appendElement(slice element) {
        size_t newSize = _data.size() + element.size;
        throwIf(newSize > kMaxDocumentSize, MalformedValue,
                "document would exceed the maximum size");
        _data.insert(_data.end() - 1, element.begin(), element.end());
        endian::encodeLittle(int32_t(newSize), _data.data());
        postcondition(_data.size() == newSize && _data.back() == 0);
    }


    vector<uint8_t> RawDocumentBuf::extract() {
        vector<uint8_t> result = std::move(_data);
        _data = {uint8_t(kMinDocumentSize), 0, 0, 0, 0};
        return result;
    }


    Document RawDocumentBuf::toDocument() const {
        return Document::fromRaw(asDocument());
    }

}
