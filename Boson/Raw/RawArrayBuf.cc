//
// RawArrayBuf.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RawArrayBuf.hh"
#include "Bson.hh"

namespace boson {
    using namespace std;


    RawBsonRef::RawBsonRef(const RawArrayBuf &array) noexcept
    :RawBsonRef(array.asArray())
    { }


    RawArrayBuf RawArrayBuf::fromDocumentBuf(RawDocumentBuf doc) {
        size_t count = RawArray(doc.asDocument()).count();
        return RawArrayBuf(std::move(doc), count);
    }


    RawArrayBuf RawArrayBuf::fromArray(const Array &items) {
        RawArrayBuf array;
        for (const Bson &item : items)
            array.push(item);
        return array;
    }


    void RawArrayBuf::push(RawBsonRef value) {
        _doc.append(to_string(_count), value);
        ++_count;
    }


    void RawArrayBuf::push(const Bson &value) {
        _doc.append(to_string(_count), value);
        ++_count;
    }

}
