//
// RawBsonRef.hh
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
#include "RawArray.hh"
#include "Binary.hh"
#include "DateTime.hh"
#include "ExtendedTypes.hh"
#include "ObjectId.hh"
#include <string_view>
#include <variant>

namespace boson {
    class RawDocumentBuf;
    class RawArrayBuf;
    class Writer;

    /** Binary data borrowed from an encoded document. */
    struct RawBinaryRef {
        BinarySubtype subtype {BinarySubtype::Generic};
        slice         bytes;

        Binary toBinary() const                         {return Binary(subtype, bytes);}

        bool operator== (const RawBinaryRef &b) const noexcept {return subtype == b.subtype && bytes == b.bytes;}
    };

    /** A regular expression borrowed from an encoded document. */
    struct RawRegexRef {
        std::string_view pattern;
        std::string_view options;

        bool operator== (const RawRegexRef &r) const noexcept {return pattern == r.pattern && options == r.options;}
    };

    /** A database pointer borrowed from an encoded document. */
    struct RawDbPointerRef {
        std::string_view namespace_;
        ObjectId         id;

        bool operator== (const RawDbPointerRef &p) const noexcept {return namespace_ == p.namespace_ && id == p.id;}
    };

    /** JavaScript code with a scope, borrowed from an encoded document. */
    struct RawJavaScriptCodeWithScopeRef {
        std::string_view code;
        RawDocument      scope;

        bool operator== (const RawJavaScriptCodeWithScopeRef &c) const noexcept {return code == c.code && scope == c.scope;}
    };


    /** A single BSON value borrowed from encoded bytes. Strings, documents, arrays, binary data
        and the other variable-length types point into the underlying buffer; fixed-width
        scalars are copied. Also used as the argument type when appending to a RawDocumentBuf. */
    class RawBsonRef {
    public:
        RawBsonRef() noexcept                           :_type(ElementType::Null) { }
        RawBsonRef(Null) noexcept                       :RawBsonRef() { }
        RawBsonRef(double d) noexcept                   :_type(ElementType::Double), _value(d) { }
        RawBsonRef(std::string_view s) noexcept         :_type(ElementType::String), _value(s) { }
        RawBsonRef(const char *s) noexcept              :RawBsonRef(std::string_view(s)) { }
        RawBsonRef(const std::string &s) noexcept       :RawBsonRef(std::string_view(s)) { }
        RawBsonRef(RawDocument d) noexcept              :_type(ElementType::EmbeddedDocument), _value(d) { }
        RawBsonRef(RawArray a) noexcept                 :_type(ElementType::Array), _value(a) { }
        RawBsonRef(const RawDocumentBuf&) noexcept;
        RawBsonRef(const RawArrayBuf&) noexcept;
        RawBsonRef(RawBinaryRef b) noexcept             :_type(ElementType::Binary), _value(b) { }
        RawBsonRef(Undefined) noexcept                  :_type(ElementType::Undefined) { }
        RawBsonRef(const ObjectId &o) noexcept          :_type(ElementType::ObjectId), _value(o) { }
        RawBsonRef(bool b) noexcept                     :_type(ElementType::Boolean), _value(b) { }
        RawBsonRef(DateTime d) noexcept                 :_type(ElementType::DateTime), _value(d) { }
        RawBsonRef(RawRegexRef r) noexcept              :_type(ElementType::RegularExpression), _value(r) { }
        RawBsonRef(RawDbPointerRef p) noexcept          :_type(ElementType::DbPointer), _value(p) { }
        RawBsonRef(RawJavaScriptCodeWithScopeRef c) noexcept :_type(ElementType::JavaScriptCodeWithScope), _value(c) { }
        RawBsonRef(int32_t i) noexcept                  :_type(ElementType::Int32), _value(i) { }
        RawBsonRef(Timestamp t) noexcept                :_type(ElementType::Timestamp), _value(t) { }
        RawBsonRef(int64_t i) noexcept                  :_type(ElementType::Int64), _value(i) { }
        RawBsonRef(const Decimal128 &d) noexcept        :_type(ElementType::Decimal128), _value(d) { }
        RawBsonRef(MinKey) noexcept                     :_type(ElementType::MinKey) { }
        RawBsonRef(MaxKey) noexcept                     :_type(ElementType::MaxKey) { }

        static RawBsonRef javaScriptCode(std::string_view code) noexcept {
            return RawBsonRef(ElementType::JavaScriptCode, code);
        }
        static RawBsonRef symbol(std::string_view sym) noexcept {
            return RawBsonRef(ElementType::Symbol, sym);
        }

        ElementType type() const noexcept               {return _type;}

        // Typed accessors. Each throws `ValueAccessUnexpectedType` if the type doesn't match.
        double                          asDouble() const        {return get<double>(ElementType::Double);}
        std::string_view                asStr() const           {return get<std::string_view>(ElementType::String);}
        RawDocument                     asDocument() const      {return get<RawDocument>(ElementType::EmbeddedDocument);}
        RawArray                        asArray() const         {return get<RawArray>(ElementType::Array);}
        RawBinaryRef                    asBinary() const        {return get<RawBinaryRef>(ElementType::Binary);}
        ObjectId                        asObjectId() const      {return get<ObjectId>(ElementType::ObjectId);}
        bool                            asBool() const          {return get<bool>(ElementType::Boolean);}
        DateTime                        asDateTime() const      {return get<DateTime>(ElementType::DateTime);}
        RawRegexRef                     asRegex() const         {return get<RawRegexRef>(ElementType::RegularExpression);}
        RawDbPointerRef                 asDbPointer() const     {return get<RawDbPointerRef>(ElementType::DbPointer);}
        std::string_view                asJavaScriptCode() const {return get<std::string_view>(ElementType::JavaScriptCode);}
        std::string_view                asSymbol() const        {return get<std::string_view>(ElementType::Symbol);}
        RawJavaScriptCodeWithScopeRef   asJavaScriptCodeWithScope() const {return get<RawJavaScriptCodeWithScopeRef>(ElementType::JavaScriptCodeWithScope);}
        int32_t                         asInt32() const         {return get<int32_t>(ElementType::Int32);}
        Timestamp                       asTimestamp() const     {return get<Timestamp>(ElementType::Timestamp);}
        int64_t                         asInt64() const         {return get<int64_t>(ElementType::Int64);}
        Decimal128                      asDecimal128() const    {return get<Decimal128>(ElementType::Decimal128);}

        /// Writes the encoded value (without type tag or key.)
        void writeTo(Writer&) const;

        /// Writes a complete element: type tag, key, then the value.
        /// Throws `InvalidCString` if the key contains a NUL byte.
        void writeElement(Writer&, std::string_view key) const;

        bool operator== (const RawBsonRef &v) const noexcept {return _type == v._type && _value == v._value;}
        bool operator!= (const RawBsonRef &v) const noexcept {return !(*this == v);}

    private:
        RawBsonRef(ElementType type, std::string_view text) noexcept :_type(type), _value(text) { }

        template <class T>
        T get(ElementType expected) const {
            if (_usuallyFalse(_type != expected))
                failType(expected);
            return std::get<T>(_value);
        }

        [[noreturn]] void failType(ElementType expected) const;

        ElementType _type;
        std::variant<std::monostate, double, std::string_view, RawDocument, RawArray,
                     RawBinaryRef, ObjectId, bool, DateTime, RawRegexRef, RawDbPointerRef,
                     RawJavaScriptCodeWithScopeRef, int32_t, Timestamp, int64_t,
                     Decimal128> _value;
    };


    /** Iterates the values of a RawArray, validating and decoding each one. */
    class RawArrayIter {
    public:
        explicit RawArrayIter(RawArray a)               :_iter(a.asDocument()) {readValue();}

        explicit operator bool() const noexcept BOSON_PURE     {return bool(_iter);}

        /// The current value.
        const RawBsonRef& operator* () const noexcept          {return *_value;}
        const RawBsonRef* operator-> () const noexcept         {return &*_value;}

        /// The element the current value came from.
        const RawElement& element() const noexcept             {return *_iter;}

        /// The zero-based position of the current value.
        size_t index() const noexcept                          {return _index;}

        RawArrayIter& operator++ ();

        bool operator!= (RawIterEnd) const noexcept            {return bool(_iter);}
        bool operator== (RawIterEnd) const noexcept            {return !_iter;}

    private:
        void readValue();

        RawIter                     _iter;
        std::optional<RawBsonRef>   _value;
        size_t                      _index {0};
    };

}
