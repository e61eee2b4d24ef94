//
// RawDocumentBuf.hh
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
#include "RawBsonRef.hh"
#include <type_traits>
#include <vector>

namespace boson {
    class Bson;
    class Document;

    /** An encoded BSON document that owns its bytes, and can be appended to.
        The buffer is a complete, valid document after every operation: each append inserts the
        element before the terminator and rewrites the length prefix. */
    class RawDocumentBuf {
    public:
        /// Creates an empty document.
        RawDocumentBuf();

        /// Takes ownership of encoded bytes. Like RawDocument::fromBytes, only the header and
        /// terminator are checked. Throws `MalformedValue`.
        static RawDocumentBuf fromBytes(std::vector<uint8_t> data);

        /// Copies a document.
        static RawDocumentBuf fromDocument(RawDocument doc) {return RawDocumentBuf(doc.data());}

        /** Appends an element. Duplicate keys are not detected.
            Throws `InvalidCString` if the key contains a NUL byte, or `MalformedValue` if the
            document would grow past the maximum size; either way the buffer is unchanged. */
        void append(std::string_view key, RawBsonRef value);

        /// Appends an element with a typed value.
        void append(std::string_view key, const Bson &value);

        /// Appends anything convertible to a RawBsonRef or a Bson.
        template <class T>
        void append(std::string_view key, const T &value) {
            if constexpr (std::is_convertible_v<const T&, RawBsonRef>)
                append(key, RawBsonRef(value));
            else
                append(key, Bson(value));
        }

        RawDocument asDocument() const noexcept         {return RawDocument(data());}
        operator RawDocument() const noexcept           {return asDocument();}

        slice data() const noexcept                     {return slice(_data);}
        size_t size() const noexcept                    {return _data.size();}
        bool empty() const noexcept                     {return _data.size() == kMinDocumentSize;}

        const std::vector<uint8_t>& bytes() const noexcept  {return _data;}

        /// Moves the bytes out, leaving this an empty document.
        std::vector<uint8_t> extract();

        RawIter begin() const                           {return RawIter(asDocument());}
        RawIterEnd end() const noexcept                 {return {};}

        std::optional<RawBsonRef> get(std::string_view key) const {return asDocument().get(key);}

        /// Decodes into a typed Document.
        Document toDocument() const;

        bool operator== (const RawDocumentBuf &d) const noexcept   {return _data == d._data;}
        bool operator!= (const RawDocumentBuf &d) const noexcept   {return _data != d._data;}

    private:
        explicit RawDocumentBuf(slice data)             :_data(data.asBytes()) { }
        void appendElement(slice element);

        std::vector<uint8_t> _data;
    };

}
