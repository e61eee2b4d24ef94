//
// RawArrayBuf.hh
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
#include "RawDocumentBuf.hh"

namespace boson {
    using Array = std::vector<Bson>;

    /** An encoded BSON array that owns its bytes, and can be appended to.
        It keeps count of its items, so each new item's key ("0", "1", ...) is generated
        without rescanning the buffer. */
    class RawArrayBuf {
    public:
        /// Creates an empty array.
        RawArrayBuf() = default;

        /// Creates an array from a range of values.
        template <class Iter>
        RawArrayBuf(Iter begin, Iter end) {
            for (; begin != end; ++begin)
                push(*begin);
        }

        /// Adopts a document as an array. Its elements are counted once, which validates them.
        static RawArrayBuf fromDocumentBuf(RawDocumentBuf);

        /// Encodes a typed array. Throws `InvalidCString` or `DepthLimitExceeded` if an item
        /// can't be encoded.
        static RawArrayBuf fromArray(const Array&);

        /// Appends a value. Throws `MalformedValue` if the array would grow past the maximum
        /// size, leaving it unchanged.
        void push(RawBsonRef value);

        /// Appends a typed value.
        void push(const Bson &value);

        /// Appends anything convertible to a RawBsonRef or a Bson.
        template <class T>
        void push(const T &value) {
            if constexpr (std::is_convertible_v<const T&, RawBsonRef>)
                push(RawBsonRef(value));
            else
                push(Bson(value));
        }

        /// The number of items. O(1).
        size_t count() const noexcept                   {return _count;}
        bool empty() const noexcept                     {return _count == 0;}

        RawArray asArray() const noexcept               {return RawArray(_doc.asDocument());}
        operator RawArray() const noexcept              {return asArray();}

        slice data() const noexcept                     {return _doc.data();}
        const std::vector<uint8_t>& bytes() const noexcept  {return _doc.bytes();}

        /// The underlying document, with keys "0", "1", ...
        const RawDocumentBuf& asDocumentBuf() const noexcept {return _doc;}

        std::optional<RawBsonRef> get(size_t index) const {return asArray().get(index);}

        RawArrayIter begin() const                      {return RawArrayIter(asArray());}
        RawIterEnd end() const noexcept                 {return {};}

        bool operator== (const RawArrayBuf &a) const noexcept  {return _doc == a._doc;}
        bool operator!= (const RawArrayBuf &a) const noexcept  {return _doc != a._doc;}

    private:
        RawArrayBuf(RawDocumentBuf doc, size_t count)   :_doc(std::move(doc)), _count(count) { }

        RawDocumentBuf _doc;
        size_t         _count {0};
    };

}
