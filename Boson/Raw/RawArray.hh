//
// RawArray.hh
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
#include "RawDocument.hh"

namespace boson {
    class RawArrayIter;

    /** A read-only view of an encoded BSON array: a document whose keys are expected to be
        "0", "1", "2" ... The keys aren't checked; elements are accessed by position. */
    class RawArray {
    public:
        /// An empty array.
        RawArray() noexcept = default;

        /// Creates a view of `data`, which must be exactly one encoded array.
        /// Throws `MalformedValue` if the header or terminator are wrong.
        static RawArray fromBytes(slice data)           {return RawArray(RawDocument::fromBytes(data));}

        /// Wraps a document, ignoring its keys.
        explicit RawArray(RawDocument doc) noexcept     :_doc(doc) { }

        /// The array as a document (with keys "0", "1", ...)
        RawDocument asDocument() const noexcept         {return _doc;}

        slice data() const noexcept                     {return _doc.data();}
        bool empty() const noexcept                     {return _doc.empty();}

        /// The number of elements. This has to iterate the whole array, so it's O(n).
        size_t count() const;

        /// Returns the element at `index`, or nullopt if the array is shorter than that.
        /// This is a linear scan.
        std::optional<RawBsonRef> get(size_t index) const;

        RawArrayIter begin() const;                     // see RawBsonRef.hh
        RawIterEnd end() const noexcept                 {return {};}

        // Typed getters. These throw `ValueAccessNotPresent` if the index is out of range, or
        // `ValueAccessUnexpectedType` if the value has a different type.
        double              getDouble(size_t index) const;
        std::string_view    getStr(size_t index) const;
        RawDocument         getDocument(size_t index) const;
        RawArray            getArray(size_t index) const;
        RawBinaryRef        getBinary(size_t index) const;
        ObjectId            getObjectId(size_t index) const;
        bool                getBool(size_t index) const;
        DateTime            getDateTime(size_t index) const;
        RawRegexRef         getRegex(size_t index) const;
        Timestamp           getTimestamp(size_t index) const;
        int32_t             getInt32(size_t index) const;
        int64_t             getInt64(size_t index) const;
        Decimal128          getDecimal128(size_t index) const;

        bool operator== (const RawArray &a) const noexcept     {return _doc == a._doc;}
        bool operator!= (const RawArray &a) const noexcept     {return _doc != a._doc;}

    private:
        RawBsonRef getTyped(size_t index, ElementType) const;

        RawDocument _doc;
    };

}
