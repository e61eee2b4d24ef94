//
// Deserializer.hh
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
#include "Bson.hh"
#include "BosonException.hh"
#include "RawBsonRef.hh"
#include "Serializer.hh"
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace boson {
    class Deserializer;

    /** Specialize this to make a type deserializable. The specialization must have a member
        `static T deserialize(Deserializer&)`. Serde.hh has the built-in ones. */
    template <class T, class = void>
    struct Deserialize;


    struct DeserializerOptions {
        bool humanReadable = false;     // Expect human-readable representations
        bool utf8Lossy = false;         // Replace invalid UTF-8 in strings instead of failing
        bool trackPath = false;         // Add the path of the failing value to exceptions
    };


    /** Receives a value of whatever type is present, from \ref Deserializer::deserializeAny.
        Each method's default implementation throws a `DeserializationError` naming the type found
        and \ref expecting. */
    class Visitor {
    public:
        virtual ~Visitor() = default;

        /// Describes what the visitor expects, for error messages, e.g. "a string".
        virtual const char* expecting() const =0;

        virtual void visitNull();
        virtual void visitUndefined();
        virtual void visitMinKey();
        virtual void visitMaxKey();
        virtual void visitBool(bool);
        virtual void visitInt32(int32_t);
        virtual void visitInt64(int64_t);
        virtual void visitDouble(double);
        virtual void visitString(std::string);
        virtual void visitBinary(Binary);
        virtual void visitObjectId(const ObjectId&);
        virtual void visitDateTime(DateTime);
        virtual void visitTimestamp(Timestamp);
        virtual void visitRegex(Regex);
        virtual void visitJavaScriptCode(std::string);
        virtual void visitSymbol(std::string);
        virtual void visitJavaScriptCodeWithScope(JavaScriptCodeWithScope);
        virtual void visitDbPointer(DbPointer);
        virtual void visitDecimal128(const Decimal128&);

        /// Called for a document; use \ref Deserializer::readDocument to read its elements.
        virtual void visitDocument(Deserializer&);

        /// Called for an array; use \ref Deserializer::readArray to read its items.
        virtual void visitArray(Deserializer&);

    protected:
        [[noreturn]] void invalidType(ElementType found) const;
    };


    /** Abstract source of a single value (possibly a document or array) that values
        deserialize themselves from. The concrete subclasses read from a Bson tree
        (BsonDeserializer) or from encoded bytes (RawDeserializer). */
    class Deserializer {
    public:
        using DocumentCallback = std::function<void(std::string_view key, Deserializer&)>;
        using ArrayCallback    = std::function<void(size_t index, Deserializer&)>;

        virtual ~Deserializer() = default;

        bool isHumanReadable() const noexcept           {return _humanReadable;}
        bool isUtf8Lossy() const noexcept               {return _utf8Lossy;}

        /// The type of the current value.
        virtual ElementType currentType() const =0;

        bool isNull() const                             {return currentType() == ElementType::Null;}

        //-------- Typed readers. These throw `DeserializationError` if the type doesn't match.

        void        readNull();
        bool        readBool();
        int32_t     readInt32();        // Also accepts an Int64 that fits
        int64_t     readInt64();        // Also accepts an Int32
        double      readDouble();       // Also accepts Int32 or Int64
        std::string readString();       // Also accepts a Symbol
        Binary      readBinary();
        ObjectId    readObjectId();
        DateTime    readDateTime();
        Timestamp   readTimestamp();
        Regex       readRegex();
        JavaScriptCode readJavaScriptCode();
        Symbol      readSymbol();
        JavaScriptCodeWithScope readJavaScriptCodeWithScope();
        DbPointer   readDbPointer();
        Decimal128  readDecimal128();

        /// Reads a value of any type.
        Bson        readBson();

        /// Reads a document, calling `fn` with each key and a Deserializer for its value.
        /// Throws `DepthLimitExceeded` past kMaxNestingDepth.
        void readDocument(const DocumentCallback &fn);

        /// Reads an array, calling `fn` with each index and a Deserializer for its value.
        void readArray(const ArrayCallback &fn);

        /// Reads any value that has a `Deserialize` specialization.
        template <class T>
        T read()                                        {return Deserialize<T>::deserialize(*this);}

        /// Reads a value using `fn(*this)`; for using one of the helpers in SerdeHelpers.hh
        /// instead of the type's usual representation.
        template <class Fn>
        auto readWith(Fn fn) -> decltype(fn(*this))     {return fn(*this);}

        /// Calls the visitor method matching the current value's type.
        void deserializeAny(Visitor&);

        /// Calls `fn()` to read a value wrapped in a named newtype. The reserved names turn on
        /// human-readable mode or lossy UTF-8 decoding for everything `fn` reads; neither can be
        /// turned off again by a nested value.
        template <class Fn>
        auto deserializeNewtype(std::string_view name, Fn fn) -> decltype(fn()) {
            bool savedHumanReadable = _humanReadable, savedUtf8Lossy = _utf8Lossy;
            if (name == kHumanReadableNewtype)
                _humanReadable = true;
            else if (name == kUtf8LossyNewtype)
                _utf8Lossy = true;
            try {
                if constexpr (std::is_void_v<decltype(fn())>) {
                    fn();
                    _humanReadable = savedHumanReadable;
                    _utf8Lossy = savedUtf8Lossy;
                } else {
                    auto result = fn();
                    _humanReadable = savedHumanReadable;
                    _utf8Lossy = savedUtf8Lossy;
                    return result;
                }
            } catch (...) {
                _humanReadable = savedHumanReadable;
                _utf8Lossy = savedUtf8Lossy;
                throw;
            }
        }

        /// Throws a `DeserializationError` describing a type mismatch.
        [[noreturn]] void invalidType(const char *expected) const;

    protected:
        explicit Deserializer(const DeserializerOptions &options, unsigned depth)
        :_humanReadable(options.humanReadable)
        ,_utf8Lossy(options.utf8Lossy)
        ,_trackPath(options.trackPath)
        ,_depth(depth)
        { }

        /// Options to pass to a child Deserializer, reflecting the current mode.
        DeserializerOptions childOptions() const noexcept {
            return {_humanReadable, _utf8Lossy, _trackPath};
        }
        unsigned depth() const noexcept                 {return _depth;}

        /// Copies text read from \ref currentScalar, replacing invalid UTF-8 in lossy mode.
        std::string ownedText(std::string_view) const;

        /// The current value, which must not be a document, array or code-with-scope.
        virtual RawBsonRef currentScalar() const =0;

        /// The current string, JavaScript code or symbol, honoring lossy mode.
        virtual std::string currentText() const =0;

        virtual JavaScriptCodeWithScope currentCodeWithScope() const =0;

        virtual void iterateDocument(const DocumentCallback&) =0;
        virtual void iterateArray(const ArrayCallback&) =0;

    private:
        bool     _humanReadable;
        bool     _utf8Lossy;
        bool     _trackPath;
        unsigned _depth;
    };


    /** A Deserializer that reads from a Bson value in memory. Lossy UTF-8 mode has no effect,
        since in-memory strings are already valid. */
    class BsonDeserializer : public Deserializer {
    public:
        explicit BsonDeserializer(const Bson &value, DeserializerOptions options ={},
                                  unsigned depth =0)
        :Deserializer(options, depth), _value(value) { }

        ElementType currentType() const override        {return _value.type();}

    protected:
        RawBsonRef currentScalar() const override;
        std::string currentText() const override;
        JavaScriptCodeWithScope currentCodeWithScope() const override;
        void iterateDocument(const DocumentCallback&) override;
        void iterateArray(const ArrayCallback&) override;

    private:
        const Bson &_value;
    };


    /** A Deserializer that reads from encoded bytes, validating each element as it's reached. */
    class RawDeserializer : public Deserializer {
    public:
        /// Reads a whole document.
        explicit RawDeserializer(RawDocument doc, DeserializerOptions options ={});

        /// Reads one element's value.
        RawDeserializer(const RawElement &element, DeserializerOptions options, unsigned depth)
        :Deserializer(options, depth), _element(element) { }

        ElementType currentType() const override        {return _element.type();}

    protected:
        RawBsonRef currentScalar() const override;
        std::string currentText() const override;
        JavaScriptCodeWithScope currentCodeWithScope() const override;
        void iterateDocument(const DocumentCallback&) override;
        void iterateArray(const ArrayCallback&) override;

    private:
        RawElement _element;
    };

}
