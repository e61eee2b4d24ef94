//
// Bson.hh
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
#include "Binary.hh"
#include "DateTime.hh"
#include "ExtendedTypes.hh"
#include "ObjectId.hh"
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace boson {
    class Bson;
    class RawBsonRef;
    class RawDocument;
    class RawDocumentBuf;
    class Writer;

    /** An array of values. */
    using Array = std::vector<Bson>;


    /** An ordered collection of key/value pairs, owning its values. Keys are unique:
        inserting an existing key replaces its value without moving it. Lookups are linear. */
    class Document {
    public:
        using Entry = std::pair<std::string, Bson>;
        using const_iterator = std::vector<Entry>::const_iterator;

        Document() noexcept;
        Document(std::initializer_list<Entry>);
        Document(const Document&);
        Document(Document&&) noexcept;
        Document& operator= (const Document&);
        Document& operator= (Document&&) noexcept;
        ~Document();

        size_t size() const noexcept                    {return _entries.size();}
        bool empty() const noexcept                     {return _entries.empty();}

        const_iterator begin() const noexcept           {return _entries.begin();}
        const_iterator end() const noexcept             {return _entries.end();}

        /// Returns a pointer to the value for `key`, or nullptr if there isn't one.
        const Bson* get(std::string_view key) const noexcept;
        Bson* get(std::string_view key) noexcept;

        bool contains(std::string_view key) const noexcept {return get(key) != nullptr;}

        /// Sets the value for `key`, returning the previous value if there was one.
        std::optional<Bson> insert(std::string key, Bson value);

        /// Removes `key`, returning its value if it was present.
        std::optional<Bson> remove(std::string_view key);

        /// Returns the value for `key` as a `T`. Throws `ValueAccessNotPresent` if it's missing,
        /// or `ValueAccessUnexpectedType` if it's a different type.
        template <class T>
        const T& getAs(std::string_view key) const;

        const std::string&  getStr(std::string_view key) const;
        double              getDouble(std::string_view key) const;
        int32_t             getInt32(std::string_view key) const;
        int64_t             getInt64(std::string_view key) const;
        bool                getBool(std::string_view key) const;
        const Document&     getDocument(std::string_view key) const;
        const Array&        getArray(std::string_view key) const;
        const ObjectId&     getObjectId(std::string_view key) const;
        DateTime            getDateTime(std::string_view key) const;
        Timestamp           getTimestamp(std::string_view key) const;
        const Binary&       getBinary(std::string_view key) const;
        const Regex&        getRegex(std::string_view key) const;
        const Decimal128&   getDecimal128(std::string_view key) const;
        bool                isNull(std::string_view key) const;

        //-------- Encoding and decoding:

        /// Encodes to an owned raw document.
        RawDocumentBuf toRaw() const;

        /// Encodes to bytes.
        std::vector<uint8_t> encode() const;

        /// Decodes a raw document, validating every element. Throws on malformed data.
        static Document fromRaw(RawDocument, unsigned depth =0);

        /// Decodes encoded bytes, which must be exactly one document.
        static Document decode(slice);

        /// Appends the encoded document to a Writer.
        void writeTo(Writer&, unsigned depth =0) const;

        bool operator== (const Document&) const;
        bool operator!= (const Document &d) const       {return !(*this == d);}

    private:
        std::vector<Entry> _entries;
    };


    /** JavaScript code with a scope document of variable bindings. */
    struct JavaScriptCodeWithScope {
        std::string code;
        Document    scope;

        bool operator== (const JavaScriptCodeWithScope &c) const {return code == c.code && scope == c.scope;}
        bool operator!= (const JavaScriptCodeWithScope &c) const {return !(*this == c);}
    };


    /** A BSON value of any type, owning all of its data. */
    class Bson {
    public:
        using Variant = std::variant<Null, double, std::string, Document, Array, Binary,
                                     Undefined, ObjectId, bool, DateTime, Regex, DbPointer,
                                     JavaScriptCode, Symbol, JavaScriptCodeWithScope, int32_t,
                                     Timestamp, int64_t, Decimal128, MinKey, MaxKey>;

        Bson() noexcept                                 { }
        Bson(Null) noexcept                             { }
        Bson(double d) noexcept                         :_value(std::in_place_type<double>, d) { }
        Bson(std::string s) noexcept                    :_value(std::in_place_type<std::string>, std::move(s)) { }
        Bson(std::string_view s)                        :Bson(std::string(s)) { }
        Bson(const char *s)                             :Bson(std::string(s)) { }
        Bson(Document d) noexcept                       :_value(std::in_place_type<Document>, std::move(d)) { }
        Bson(Array a) noexcept                          :_value(std::in_place_type<Array>, std::move(a)) { }
        Bson(Binary b) noexcept                         :_value(std::in_place_type<Binary>, std::move(b)) { }
        Bson(const Uuid &u)                             :Bson(Binary::fromUuid(u)) { }
        Bson(Undefined) noexcept                        :_value(std::in_place_type<Undefined>) { }
        Bson(const ObjectId &o) noexcept                :_value(std::in_place_type<ObjectId>, o) { }
        Bson(bool b) noexcept                           :_value(std::in_place_type<bool>, b) { }
        Bson(DateTime d) noexcept                       :_value(std::in_place_type<DateTime>, d) { }
        Bson(Regex r) noexcept                          :_value(std::in_place_type<Regex>, std::move(r)) { }
        Bson(DbPointer p) noexcept                      :_value(std::in_place_type<DbPointer>, std::move(p)) { }
        Bson(JavaScriptCode c) noexcept                 :_value(std::in_place_type<JavaScriptCode>, std::move(c)) { }
        Bson(Symbol s) noexcept                         :_value(std::in_place_type<Symbol>, std::move(s)) { }
        Bson(JavaScriptCodeWithScope c) noexcept        :_value(std::in_place_type<JavaScriptCodeWithScope>, std::move(c)) { }
        Bson(int32_t i) noexcept                        :_value(std::in_place_type<int32_t>, i) { }
        Bson(Timestamp t) noexcept                      :_value(std::in_place_type<Timestamp>, t) { }
        Bson(int64_t i) noexcept                        :_value(std::in_place_type<int64_t>, i) { }
        Bson(const Decimal128 &d) noexcept              :_value(std::in_place_type<Decimal128>, d) { }
        Bson(MinKey) noexcept                           :_value(std::in_place_type<MinKey>) { }
        Bson(MaxKey) noexcept                           :_value(std::in_place_type<MaxKey>) { }

        /// The wire type of this value.
        ElementType type() const noexcept               {return typeAt(_value.index());}

        template <class T>
        bool is() const noexcept                        {return std::holds_alternative<T>(_value);}

        /// Returns the value as a `T`, or throws `ValueAccessUnexpectedType`.
        template <class T>
        const T& as() const {
            if (_usuallyFalse(!is<T>()))
                failType(typeOf<T>());
            return std::get<T>(_value);
        }

        template <class T>
        T& as() {
            if (_usuallyFalse(!is<T>()))
                failType(typeOf<T>());
            return std::get<T>(_value);
        }

        /// Returns a pointer to the value as a `T`, or nullptr if it's a different type.
        template <class T>
        const T* getIf() const noexcept                 {return std::get_if<T>(&_value);}

        bool isNull() const noexcept                    {return is<Null>();}

        const Variant& variant() const noexcept         {return _value;}

        /// The ElementType corresponding to the C++ type `T`.
        template <class T>
        static constexpr ElementType typeOf() noexcept  {return typeAt(indexOf<T>());}

        //-------- Encoding and decoding:

        /// Materializes a raw value, validating nested documents and arrays.
        /// Throws `DepthLimitExceeded` if nesting exceeds kMaxNestingDepth.
        static Bson fromRaw(const RawBsonRef&, unsigned depth =0);

        /// Writes the encoded value (without type tag or key.)
        void writeTo(Writer&, unsigned depth =0) const;

        bool operator== (const Bson &b) const           {return _value == b._value;}
        bool operator!= (const Bson &b) const           {return !(_value == b._value);}

    private:
        static constexpr ElementType typeAt(size_t index) noexcept {return kTypes[index];}

        template <class T, size_t I = 0>
        static constexpr size_t indexOf() noexcept {
            if constexpr (std::is_same_v<T, std::variant_alternative_t<I, Variant>>)
                return I;
            else
                return indexOf<T, I + 1>();
        }

        [[noreturn]] void failType(ElementType expected) const;

        static constexpr ElementType kTypes[] = {
            ElementType::Null, ElementType::Double, ElementType::String,
            ElementType::EmbeddedDocument, ElementType::Array, ElementType::Binary,
            ElementType::Undefined, ElementType::ObjectId, ElementType::Boolean,
            ElementType::DateTime, ElementType::RegularExpression, ElementType::DbPointer,
            ElementType::JavaScriptCode, ElementType::Symbol,
            ElementType::JavaScriptCodeWithScope, ElementType::Int32, ElementType::Timestamp,
            ElementType::Int64, ElementType::Decimal128, ElementType::MinKey, ElementType::MaxKey,
        };

        Variant _value;
    };


    namespace internal {
        [[noreturn]] void failDocumentAccess(std::string_view key, const Bson *value,
                                             ElementType expected);
    }

    template <class T>
    const T& Document::getAs(std::string_view key) const {
        const Bson *value = get(key);
        if (_usuallyFalse(!value || !value->is<T>()))
            internal::failDocumentAccess(key, value, Bson::typeOf<T>());
        return *value->getIf<T>();
    }

}
