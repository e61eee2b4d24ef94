//
// RawDocument.hh
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
#include "BSONSpec.hh"
#include "boson/slice.hh"
#include <optional>
#include <string>
#include <string_view>

namespace boson {
    class RawArray;
    class RawBsonRef;
    class RawIter;
    class ObjectId;
    class DateTime;
    struct RawBinaryRef;
    struct RawRegexRef;
    struct Timestamp;
    struct Decimal128;

    /** Marks the end of a RawIter or RawArrayIter in range-based `for` loops. */
    struct RawIterEnd { };


    /** A read-only view of an encoded BSON document in memory that someone else owns.
        Constructing one checks only the header (length prefix and terminator); each element is
        validated when it's reached by iteration or lookup. The memory must remain valid as long
        as this object, or anything derived from it, is in use. */
    class RawDocument {
    public:
        /// An empty document.
        RawDocument() noexcept;

        /// Creates a view of `data`, which must be exactly one document: its length prefix must
        /// equal `data.size` and its last byte must be 0. Throws `MalformedValue` otherwise.
        static RawDocument fromBytes(slice data);

        /// The encoded bytes.
        slice data() const noexcept                     {return _data;}
        size_t size() const noexcept                    {return _data.size;}

        /// True if there are no elements.
        bool empty() const noexcept                     {return _data.size == kMinDocumentSize;}

        inline RawIter begin() const;
        RawIterEnd end() const noexcept                 {return {};}

        /** Looks up a value by key. This is a linear scan, O(n) in the number of elements.
            Throws if a malformed element is encountered before the key is found. */
        std::optional<RawBsonRef> get(std::string_view key) const;

        bool contains(std::string_view key) const;

        // Typed getters. These throw `ValueAccessNotPresent` if the key is missing, or
        // `ValueAccessUnexpectedType` if its value has a different type.
        double              getDouble(std::string_view key) const;
        std::string_view    getStr(std::string_view key) const;
        RawDocument         getDocument(std::string_view key) const;
        RawArray            getArray(std::string_view key) const;
        RawBinaryRef        getBinary(std::string_view key) const;
        ObjectId            getObjectId(std::string_view key) const;
        bool                getBool(std::string_view key) const;
        DateTime            getDateTime(std::string_view key) const;
        RawRegexRef         getRegex(std::string_view key) const;
        Timestamp           getTimestamp(std::string_view key) const;
        int32_t             getInt32(std::string_view key) const;
        int64_t             getInt64(std::string_view key) const;
        Decimal128          getDecimal128(std::string_view key) const;
        bool                isNull(std::string_view key) const;

        /// Byte-wise equality.
        bool operator== (const RawDocument &d) const noexcept  {return _data == d._data;}
        bool operator!= (const RawDocument &d) const noexcept  {return _data != d._data;}

    private:
        explicit RawDocument(slice data) noexcept       :_data(data) { }

        RawBsonRef getTyped(std::string_view key, ElementType) const;

        slice _data;

        friend class RawDocumentBuf;
    };


    /** One element of a document, as found by a RawIter: the type, the key, and the value's
        bytes. The value itself isn't validated or decoded until \ref value is called. */
    class RawElement {
    public:
        RawElement() noexcept = default;
        RawElement(ElementType type, slice key, slice value, size_t offset) noexcept
        :_type(type), _key(key), _value(value), _offset(offset) { }

        ElementType type() const noexcept               {return _type;}

        std::string_view key() const noexcept           {return _key.asStringView();}
        slice keyBytes() const noexcept                 {return _key;}

        /// The encoded value, not including the type tag or key.
        slice valueBytes() const noexcept               {return _value;}

        /// Byte offset of this element within its document.
        size_t offset() const noexcept                  {return _offset;}

        /// Validates and decodes the value. Strings must be valid UTF-8.
        /// Errors carry this element's key and offset.
        RawBsonRef value() const;

        /// Like \ref value, but text (strings, regexes, code, namespaces) is returned without
        /// checking that it's valid UTF-8. Pass it through ReplaceInvalidUTF8 before use.
        RawBsonRef valueWithoutUtf8Check() const;

        /// For a string, symbol or JavaScript code element, returns the text with any invalid
        /// UTF-8 replaced by U+FFFD. Other structural errors still throw.
        std::string textUtf8Lossy() const;

    private:
        RawBsonRef decode(bool checkUtf8) const;

        ElementType _type {ElementType::Null};
        slice       _key;
        slice       _value;
        size_t      _offset {0};
    };


    /** Iterates the elements of a RawDocument, validating each one as it's reached.
        Reaching a malformed element throws, after which the iterator is at its end.
        Example:
        ```
        for (auto &elem : doc)
            printf("%s\n", std::string(elem.key()).c_str());
        ``` */
    class RawIter {
    public:
        /// Constructs an iterator positioned at the first element. If `lossyKeys` is true,
        /// keys aren't checked for valid UTF-8.
        explicit RawIter(RawDocument doc, bool lossyKeys =false);

        /// Returns false when the iterator reaches the end.
        explicit operator bool() const noexcept BOSON_PURE     {return !_done;}

        const RawElement& operator* () const noexcept          {return _element;}
        const RawElement* operator-> () const noexcept         {return &_element;}

        /// Steps to the next element. Throws if it's malformed.
        RawIter& operator++ ();

        bool operator!= (RawIterEnd) const noexcept            {return !_done;}
        bool operator== (RawIterEnd) const noexcept            {return _done;}

    private:
        void readNext();

        slice       _data;
        size_t      _pos;
        RawElement  _element;
        bool        _done {false};
        bool        _lossyKeys;
    };


    inline RawIter RawDocument::begin() const {return RawIter(*this);}

}
