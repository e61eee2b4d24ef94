//
// Writer.cc
//
// Copyright 2015-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Writer.hh"
#include "BosonException.hh"
#include "BSONSpec.hh"

namespace boson {

    void Writer::writeCString(slice s) {
        throwIf(s.findByte(0) != nullptr, InvalidCString,
                "\"%.*s\" contains a NUL byte", FMTSLICE(s));
        write(s);
        writeByte(0);
    }


    void Writer::writeString(slice s) {
        throwIf(s.size >= kMaxDocumentSize, MalformedValue, "string is too long");
        writeInt32(int32_t(s.size + 1));
        write(s);
        writeByte(0);
    }


    void Writer::endLengthPrefix(size_t pos) {
        size_t len = length() - pos;
        throwIf(len > kMaxDocumentSize, MalformedValue,
                "encoded size %zu exceeds the maximum", len);
        patchInt32(pos, int32_t(len));
    }

}
