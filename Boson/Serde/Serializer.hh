//
// Serializer.hh
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
#include "RawDocumentBuf.hh"
#include "Writer.hh"
#include <string>
#include <string_view>
#include <vector>

namespace boson {

    /** Specialize this to make a type serializable. The specialization must have a member
        `static void serialize(const T&, Serializer&)`. Serde.hh has the built-in ones. */
    template <class T, class = void>
    struct Serialize;


    /// Reserved newtype name that switches a subtree to human-readable representations.
    static constexpr std::string_view kHumanReadableNewtype = "$__boson_private_human_readable";

    /// Reserved newtype name that switches a subtree to lossy UTF-8 decoding.
    static constexpr std::string_view kUtf8LossyNewtype = "$__boson_private_utf8_lossy";


    struct SerializerOptions {
        bool humanReadable = false;     // Use human-readable representations (dates as strings...)
        bool trackPath = false;         // Add the path of the failing value to exceptions
    };


    /** Abstract visitor interface that values serialize themselves to. There's one write method
        per BSON type, plus document and array structure. The concrete subclasses produce a
        Bson tree (BsonSerializer) or encoded bytes (RawSerializer).

        A document is written as `beginDocument`, then for each element `writeKey` followed by
        exactly one value, then `endDocument`. Array items are written between `beginArray` and
        `endArray` with no keys. */
    class Serializer {
    public:
        explicit Serializer(SerializerOptions options ={})
        :_humanReadable(options.humanReadable)
        ,_trackPath(options.trackPath)
        { }

        virtual ~Serializer() = default;

        /// True if values should use their human-readable forms.
        bool isHumanReadable() const noexcept           {return _humanReadable;}

        //-------- Scalars:

        virtual void writeNull() =0;
        virtual void writeUndefined() =0;
        virtual void writeMinKey() =0;
        virtual void writeMaxKey() =0;
        virtual void writeBool(bool) =0;
        virtual void writeInt32(int32_t) =0;
        virtual void writeInt64(int64_t) =0;
        virtual void writeDouble(double) =0;
        virtual void writeString(std::string_view) =0;
        virtual void writeBinary(BinarySubtype, slice bytes) =0;
        virtual void writeObjectId(const ObjectId&) =0;
        virtual void writeDateTime(DateTime) =0;
        virtual void writeTimestamp(Timestamp) =0;
        virtual void writeRegex(std::string_view pattern, std::string_view options) =0;
        virtual void writeJavaScriptCode(std::string_view) =0;
        virtual void writeSymbol(std::string_view) =0;
        virtual void writeJavaScriptCodeWithScope(std::string_view code, const Document &scope) =0;
        virtual void writeDbPointer(std::string_view ns, const ObjectId&) =0;
        virtual void writeDecimal128(const Decimal128&) =0;

        /// Writes an already-encoded document.
        virtual void writeRawDocument(RawDocument) =0;

        /// Writes an already-encoded array.
        virtual void writeRawArray(RawArray) =0;

        /// Writes any typed value, recursing into documents and arrays.
        void writeBson(const Bson&);

        /// Writes a whole Document.
        void writeDocument(const Document&);

        //-------- Structure:

        /// Starts a document. Throws `DepthLimitExceeded` past kMaxNestingDepth.
        void beginDocument();

        /// Sets the key of the next value in the current document.
        /// Throws `SerializationError` if not in a document, or if a key is already pending.
        virtual void writeKey(std::string_view key) =0;

        void endDocument();

        void beginArray();
        void endArray();

        //-------- Generic values:

        /// Writes any value that has a `Serialize` specialization.
        template <class T>
        void write(const T &value)                      {Serialize<T>::serialize(value, *this);}

        /// Writes a key and value.
        template <class T>
        void writeField(std::string_view key, const T &value) {
            writeKey(key);
            withPathKey(key, [&] {write(value);});
        }

        /// Writes a key, then calls `fn(value, *this)` to write the value; for using one of the
        /// helpers in SerdeHelpers.hh instead of the type's usual representation.
        template <class T, class Fn>
        void writeField(std::string_view key, const T &value, Fn fn) {
            writeKey(key);
            withPathKey(key, [&] {fn(value, *this);});
        }

        /// Writes an array item, tagging errors with its index.
        template <class T>
        void writeItem(size_t index, const T &value) {
            withPathIndex(index, [&] {write(value);});
        }

        /// Calls `fn()` to write a value wrapped in a named newtype. The reserved name
        /// kHumanReadableNewtype turns on human-readable mode for everything `fn` writes; it can't
        /// be turned off again by a nested value.
        template <class Fn>
        void serializeNewtype(std::string_view name, Fn fn) {
            bool savedHumanReadable = _humanReadable;
            if (name == kHumanReadableNewtype)
                _humanReadable = true;
            try {
                fn();
            } catch (...) {
                _humanReadable = savedHumanReadable;
                throw;
            }
            _humanReadable = savedHumanReadable;
        }

        //-------- Error paths:

        template <class Fn>
        void withPathKey(std::string_view key, Fn &&fn) {
            if (!_trackPath)
                return fn();
            try {
                fn();
            } catch (BosonException &x) {
                x.prependPathKey(std::string(key));
                throw;
            }
        }

        template <class Fn>
        void withPathIndex(size_t index, Fn &&fn) {
            if (!_trackPath)
                return fn();
            try {
                fn();
            } catch (BosonException &x) {
                x.prependPathIndex(index);
                throw;
            }
        }

    protected:
        virtual void _beginDocument() =0;
        virtual void _endDocument() =0;
        virtual void _beginArray() =0;
        virtual void _endArray() =0;

        /// Current nesting depth of documents and arrays.
        unsigned depth() const noexcept                 {return _depth;}

    private:
        bool     _humanReadable;
        bool     _trackPath;
        unsigned _depth {0};
    };


    /** A Serializer that builds a Bson value. */
    class BsonSerializer : public Serializer {
    public:
        explicit BsonSerializer(SerializerOptions options ={})  :Serializer(options) { }

        /// Returns the value written. Throws `SerializationError` if nothing was written or a
        /// document or array is still open.
        Bson finish();

        void writeNull() override                       {emit(Null());}
        void writeUndefined() override                  {emit(Undefined());}
        void writeMinKey() override                     {emit(MinKey());}
        void writeMaxKey() override                     {emit(MaxKey());}
        void writeBool(bool b) override                 {emit(b);}
        void writeInt32(int32_t i) override             {emit(i);}
        void writeInt64(int64_t i) override             {emit(i);}
        void writeDouble(double d) override             {emit(d);}
        void writeString(std::string_view s) override   {emit(s);}
        void writeBinary(BinarySubtype st, slice bytes) override {emit(Binary(st, bytes));}
        void writeObjectId(const ObjectId &o) override  {emit(o);}
        void writeDateTime(DateTime d) override         {emit(d);}
        void writeTimestamp(Timestamp t) override       {emit(t);}
        void writeRegex(std::string_view pattern, std::string_view options) override;
        void writeJavaScriptCode(std::string_view c) override {emit(JavaScriptCode{std::string(c)});}
        void writeSymbol(std::string_view s) override   {emit(Symbol{std::string(s)});}
        void writeJavaScriptCodeWithScope(std::string_view code, const Document &scope) override {
            emit(JavaScriptCodeWithScope{std::string(code), scope});
        }
        void writeDbPointer(std::string_view ns, const ObjectId &id) override {
            emit(DbPointer{std::string(ns), id});
        }
        void writeDecimal128(const Decimal128 &d) override {emit(d);}
        void writeRawDocument(RawDocument) override;
        void writeRawArray(RawArray) override;
        void writeKey(std::string_view key) override;

    protected:
        void _beginDocument() override;
        void _endDocument() override;
        void _beginArray() override;
        void _endArray() override;

    private:
        struct Frame {
            bool                        isArray;
            Document                    doc;
            Array                       array;
            std::optional<std::string>  key;        // Key awaiting its value
        };

        void emit(Bson);

        std::vector<Frame>  _stack;
        std::optional<Bson> _result;
    };


    /** A Serializer that encodes directly to BSON bytes. The top-level value must be a
        document. Each element's key is held until its value's type is known, since the type
        tag precedes the key on the wire. */
    class RawSerializer : public Serializer {
    public:
        explicit RawSerializer(SerializerOptions options ={})   :Serializer(options) { }

        /// Returns the encoded document. Throws `SerializationError` if it's incomplete.
        RawDocumentBuf finish();

        void writeNull() override;
        void writeUndefined() override;
        void writeMinKey() override;
        void writeMaxKey() override;
        void writeBool(bool) override;
        void writeInt32(int32_t) override;
        void writeInt64(int64_t) override;
        void writeDouble(double) override;
        void writeString(std::string_view) override;
        void writeBinary(BinarySubtype, slice bytes) override;
        void writeObjectId(const ObjectId&) override;
        void writeDateTime(DateTime) override;
        void writeTimestamp(Timestamp) override;
        void writeRegex(std::string_view pattern, std::string_view options) override;
        void writeJavaScriptCode(std::string_view) override;
        void writeSymbol(std::string_view) override;
        void writeJavaScriptCodeWithScope(std::string_view code, const Document &scope) override;
        void writeDbPointer(std::string_view ns, const ObjectId&) override;
        void writeDecimal128(const Decimal128&) override;
        void writeRawDocument(RawDocument) override;
        void writeRawArray(RawArray) override;
        void writeKey(std::string_view key) override;

    protected:
        void _beginDocument() override;
        void _endDocument() override;
        void _beginArray() override;
        void _endArray() override;

    private:
        struct Frame {
            size_t                      start;      // Offset of the length prefix
            bool                        isArray;
            size_t                      count;      // Items written so far (arrays)
            std::optional<std::string>  key;        // Key awaiting its value (documents)
        };

        void writeScalar(const RawBsonRef&);
        void beginElement(ElementType);

        Writer              _out;
        std::vector<Frame>  _stack;
        bool                _finished {false};
    };

}
