//
// Deserializer.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Deserializer.hh"
#include "NumConversion.hh"
#include "UTF8.hh"
#include <cinttypes>

namespace boson {
    using namespace std;


#pragma mark - VISITOR:


    void Visitor::invalidType(ElementType found) const {
        BosonException::_throw(DeserializationError, "invalid type: %s, expected %s",
                               ElementTypeName(found), expecting());
    }

    void Visitor::visitNull()                           {invalidType(ElementType::Null);}
    void Visitor::visitUndefined()                      {invalidType(ElementType::Undefined);}
    void Visitor::visitMinKey()                         {invalidType(ElementType::MinKey);}
    void Visitor::visitMaxKey()                         {invalidType(ElementType::MaxKey);}
    void Visitor::visitBool(bool)                       {invalidType(ElementType::Boolean);}
    void Visitor::visitInt32(int32_t)                   {invalidType(ElementType::Int32);}
    void Visitor::visitInt64(int64_t)                   {invalidType(ElementType::Int64);}
    void Visitor::visitDouble(double)                   {invalidType(ElementType::Double);}
    void Visitor::visitString(string)                   {invalidType(ElementType::String);}
    void Visitor::visitBinary(Binary)                   {invalidType(ElementType::Binary);}
    void Visitor::visitObjectId(const ObjectId&)        {invalidType(ElementType::ObjectId);}
    void Visitor::visitDateTime(DateTime)               {invalidType(ElementType::DateTime);}
    void Visitor::visitTimestamp(Timestamp)             {invalidType(ElementType::Timestamp);}
    void Visitor::visitRegex(Regex)                     {invalidType(ElementType::RegularExpression);}
    void Visitor::visitJavaScriptCode(string)           {invalidType(ElementType::JavaScriptCode);}
    void Visitor::visitSymbol(string)                   {invalidType(ElementType::Symbol);}
    void Visitor::visitJavaScriptCodeWithScope(JavaScriptCodeWithScope) {
        invalidType(ElementType::JavaScriptCodeWithScope);
    }
    void Visitor::visitDbPointer(DbPointer)             {invalidType(ElementType::DbPointer);}
    void Visitor::visitDecimal128(const Decimal128&)    {invalidType(ElementType::Decimal128);}
    void Visitor::visitDocument(Deserializer&)          {invalidType(ElementType::EmbeddedDocument);}
    void Visitor::visitArray(Deserializer&)             {invalidType(ElementType::Array);}


    namespace {
        // Visitor that materializes whatever it's given as a Bson value.
        class BsonBuilder : public Visitor {
        public:
            Bson result;

            const char* expecting() const override      {return "any BSON value";}

            void visitNull() override                   {result = Null();}
            void visitUndefined() override              {result = Undefined();}
            void visitMinKey() override                 {result = MinKey();}
            void visitMaxKey() override                 {result = MaxKey();}
            void visitBool(bool b) override             {result = b;}
            void visitInt32(int32_t i) override         {result = i;}
            void visitInt64(int64_t i) override         {result = i;}
            void visitDouble(double d) override         {result = d;}
            void visitString(string s) override         {result = std::move(s);}
            void visitBinary(Binary b) override         {result = std::move(b);}
            void visitObjectId(const ObjectId &o) override {result = o;}
            void visitDateTime(DateTime d) override     {result = d;}
            void visitTimestamp(Timestamp t) override   {result = t;}
            void visitRegex(Regex r) override           {result = std::move(r);}
            void visitJavaScriptCode(string c) override {result = JavaScriptCode{std::move(c)};}
            void visitSymbol(string s) override         {result = Symbol{std::move(s)};}
            void visitJavaScriptCodeWithScope(JavaScriptCodeWithScope c) override {
                result = std::move(c);
            }
            void visitDbPointer(DbPointer p) override   {result = std::move(p);}
            void visitDecimal128(const Decimal128 &d) override {result = d;}

            void visitDocument(Deserializer &d) override {
                Document doc;
                d.readDocument([&](string_view key, Deserializer &child) {
                    doc.insert(string(key), child.readBson());
                });
                result = std::move(doc);
            }

            void visitArray(Deserializer &d) override {
                Array array;
                d.readArray([&](size_t, Deserializer &child) {
                    array.push_back(child.readBson());
                });
                result = std::move(array);
            }
        };
    }


#pragma mark - DESERIALIZER:


    void Deserializer::invalidType(const char *expected) const {
        BosonException::_throw(DeserializationError, "invalid type: %s, expected %s",
                               ElementTypeName(currentType()), expected);
    }


    string Deserializer::ownedText(string_view text) const {
        if (_utf8Lossy)
            return ReplaceInvalidUTF8(slice(text));
        return string(text);
    }


    void Deserializer::readNull() {
        if (currentType() != ElementType::Null)
            invalidType("null");
    }

    bool Deserializer::readBool() {
        if (currentType() != ElementType::Boolean)
            invalidType("a boolean");
        return currentScalar().asBool();
    }

    int32_t Deserializer::readInt32() {
        switch (currentType()) {
            case ElementType::Int32:
                return currentScalar().asInt32();
            case ElementType::Int64: {
                int64_t i = currentScalar().asInt64();
                if (auto result = ExactIntCast<int32_t>(i); result)
                    return *result;
                BosonException::_throw(DeserializationError,
                                       "invalid value: integer %" PRIi64 ", expected an int32", i);
            }
            default:
                invalidType("an int32");
        }
    }

    int64_t Deserializer::readInt64() {
        switch (currentType()) {
            case ElementType::Int32:    return currentScalar().asInt32();
            case ElementType::Int64:    return currentScalar().asInt64();
            default:                    invalidType("an int64");
        }
    }

    double Deserializer::readDouble() {
        switch (currentType()) {
            case ElementType::Double:   return currentScalar().asDouble();
            case ElementType::Int32:    return currentScalar().asInt32();
            case ElementType::Int64: {
                int64_t i = currentScalar().asInt64();
                if (auto d = ExactDoubleFromInt64(i); d)
                    return *d;
                BosonException::_throw(LossyConversion,
                                       "cannot convert i64 %" PRIi64 " to f64 exactly", i);
            }
            default:                    invalidType("a double");
        }
    }

    string Deserializer::readString() {
        switch (currentType()) {
            case ElementType::String:
            case ElementType::Symbol:
                return currentText();
            default:
                invalidType("a string");
        }
    }

    Binary Deserializer::readBinary() {
        if (currentType() != ElementType::Binary)
            invalidType("binary data");
        return currentScalar().asBinary().toBinary();
    }

    ObjectId Deserializer::readObjectId() {
        if (currentType() != ElementType::ObjectId)
            invalidType("an ObjectId");
        return currentScalar().asObjectId();
    }

    DateTime Deserializer::readDateTime() {
        if (currentType() != ElementType::DateTime)
            invalidType("a DateTime");
        return currentScalar().asDateTime();
    }

    Timestamp Deserializer::readTimestamp() {
        if (currentType() != ElementType::Timestamp)
            invalidType("a Timestamp");
        return currentScalar().asTimestamp();
    }

    Regex Deserializer::readRegex() {
        if (currentType() != ElementType::RegularExpression)
            invalidType("a regular expression");
        RawRegexRef regex = currentScalar().asRegex();
        return Regex(ownedText(regex.pattern), ownedText(regex.options));
    }

    JavaScriptCode Deserializer::readJavaScriptCode() {
        if (currentType() != ElementType::JavaScriptCode)
            invalidType("JavaScript code");
        return JavaScriptCode{currentText()};
    }

    Symbol Deserializer::readSymbol() {
        if (currentType() != ElementType::Symbol)
            invalidType("a symbol");
        return Symbol{currentText()};
    }

    JavaScriptCodeWithScope Deserializer::readJavaScriptCodeWithScope() {
        if (currentType() != ElementType::JavaScriptCodeWithScope)
            invalidType("JavaScript code with scope");
        return currentCodeWithScope();
    }

    DbPointer Deserializer::readDbPointer() {
        if (currentType() != ElementType::DbPointer)
            invalidType("a DbPointer");
        RawDbPointerRef ptr = currentScalar().asDbPointer();
        return DbPointer{ownedText(ptr.namespace_), ptr.id};
    }

    Decimal128 Deserializer::readDecimal128() {
        if (currentType() != ElementType::Decimal128)
            invalidType("a Decimal128");
        return currentScalar().asDecimal128();
    }


    Bson Deserializer::readBson() {
        BsonBuilder builder;
        deserializeAny(builder);
        return std::move(builder.result);
    }


    void Deserializer::readDocument(const DocumentCallback &fn) {
        if (currentType() != ElementType::EmbeddedDocument)
            invalidType("a document");
        throwIf(_depth >= kMaxNestingDepth, DepthLimitExceeded,
                "documents nested more than %u deep", kMaxNestingDepth);
        if (!_trackPath)
            return iterateDocument(fn);
        iterateDocument([&](string_view key, Deserializer &child) {
            try {
                fn(key, child);
            } catch (BosonException &x) {
                x.prependPathKey(string(key));
                throw;
            }
        });
    }


    void Deserializer::readArray(const ArrayCallback &fn) {
        if (currentType() != ElementType::Array)
            invalidType("an array");
        throwIf(_depth >= kMaxNestingDepth, DepthLimitExceeded,
                "arrays nested more than %u deep", kMaxNestingDepth);
        if (!_trackPath)
            return iterateArray(fn);
        iterateArray([&](size_t index, Deserializer &child) {
            try {
                fn(index, child);
            } catch (BosonException &x) {
                x.prependPathIndex(index);
                throw;
            }
        });
    }


    void Deserializer::deserializeAny(Visitor &visitor) {
        switch (currentType()) {
            case ElementType::Double:           return visitor.visitDouble(readDouble());
            case ElementType::String:           return visitor.visitString(currentText());
            case ElementType::EmbeddedDocument: return visitor.visitDocument(*this);
            case ElementType::Array:            return visitor.visitArray(*this);
            case ElementType::Binary:           return visitor.visitBinary(readBinary());
            case ElementType::Undefined:        return visitor.visitUndefined();
            case ElementType::ObjectId:         return visitor.visitObjectId(readObjectId());
            case ElementType::Boolean:          return visitor.visitBool(readBool());
            case ElementType::DateTime:         return visitor.visitDateTime(readDateTime());
            case ElementType::Null:             return visitor.visitNull();
            case ElementType::RegularExpression: return visitor.visitRegex(readRegex());
            case ElementType::DbPointer:        return visitor.visitDbPointer(readDbPointer());
            case ElementType::JavaScriptCode:   return visitor.visitJavaScriptCode(currentText());
            case ElementType::Symbol:           return visitor.visitSymbol(currentText());
            case ElementType::JavaScriptCodeWithScope:
                return visitor.visitJavaScriptCodeWithScope(currentCodeWithScope());
            case ElementType::Int32:            return visitor.visitInt32(readInt32());
            case ElementType::Timestamp:        return visitor.visitTimestamp(readTimestamp());
            case ElementType::Int64:            return visitor.visitInt64(readInt64());
            case ElementType::Decimal128:       return visitor.visitDecimal128(readDecimal128());
            case ElementType::MinKey:           return visitor.visitMinKey();
            case ElementType::MaxKey:           return visitor.visitMaxKey();
        }
    }


#pragma mark - BSON DESERIALIZER:


    RawBsonRef BsonDeserializer::currentScalar() const {
        switch (_value.type()) {
            case ElementType::String:
                return string_view(_value.as<string>());
            case ElementType::Binary: {
                auto &bin = _value.as<Binary>();
                return RawBinaryRef{bin.subtype, bin.asSlice()};
            }
            case ElementType::RegularExpression: {
                auto &regex = _value.as<Regex>();
                return RawRegexRef{regex.pattern, regex.options};
            }
            case ElementType::DbPointer: {
                auto &ptr = _value.as<DbPointer>();
                return RawDbPointerRef{ptr.namespace_, ptr.id};
            }
            case ElementType::JavaScriptCode:
                return RawBsonRef::javaScriptCode(_value.as<JavaScriptCode>().code);
            case ElementType::Symbol:
                return RawBsonRef::symbol(_value.as<Symbol>().symbol);
            case ElementType::Double:       return _value.as<double>();
            case ElementType::ObjectId:     return _value.as<ObjectId>();
            case ElementType::Boolean:      return _value.as<bool>();
            case ElementType::DateTime:     return _value.as<DateTime>();
            case ElementType::Int32:        return _value.as<int32_t>();
            case ElementType::Timestamp:    return _value.as<Timestamp>();
            case ElementType::Int64:        return _value.as<int64_t>();
            case ElementType::Decimal128:   return _value.as<Decimal128>();
            case ElementType::Null:         return Null();
            case ElementType::Undefined:    return Undefined();
            case ElementType::MinKey:       return MinKey();
            case ElementType::MaxKey:       return MaxKey();
            case ElementType::EmbeddedDocument:
            case ElementType::Array:
            case ElementType::JavaScriptCodeWithScope:
                break;
        }
        BosonException::_throw(InternalError, "%s is not a scalar", ElementTypeName(_value.type()));
    }


    string BsonDeserializer::currentText() const {
        switch (_value.type()) {
            case ElementType::String:           return _value.as<string>();
            case ElementType::JavaScriptCode:   return _value.as<JavaScriptCode>().code;
            case ElementType::Symbol:           return _value.as<Symbol>().symbol;
            default:                            invalidType("a string");
        }
    }


    JavaScriptCodeWithScope BsonDeserializer::currentCodeWithScope() const {
        return _value.as<JavaScriptCodeWithScope>();
    }


    void BsonDeserializer::iterateDocument(const DocumentCallback &fn) {
        for (auto &entry : _value.as<Document>()) {
            BsonDeserializer child(entry.second, childOptions(), depth() + 1);
            fn(entry.first, child);
        }
    }


    void BsonDeserializer::iterateArray(const ArrayCallback &fn) {
        size_t index = 0;
        for (auto &item : _value.as<Array>()) {
            BsonDeserializer child(item, childOptions(), depth() + 1);
            fn(index++, child);
        }
    }


#pragma mark - RAW DESERIALIZER:


    // The root is treated as an element with an empty key whose value is the document.
    RawDeserializer::RawDeserializer(RawDocument doc, DeserializerOptions options)
    :Deserializer(options, 0)
    ,_element(ElementType::EmbeddedDocument, slice(""), doc.data(), 0)
    { }


    RawBsonRef RawDeserializer::currentScalar() const {
        // In lossy mode the text is repaired afterwards, by ownedText().
        if (isUtf8Lossy())
            return _element.valueWithoutUtf8Check();
        return _element.value();
    }


    string RawDeserializer::currentText() const {
        if (isUtf8Lossy())
            return _element.textUtf8Lossy();
        RawBsonRef value = _element.value();
        switch (value.type()) {
            case ElementType::String:           return string(value.asStr());
            case ElementType::JavaScriptCode:   return string(value.asJavaScriptCode());
            case ElementType::Symbol:           return string(value.asSymbol());
            default:                            invalidType("a string");
        }
    }


    JavaScriptCodeWithScope RawDeserializer::currentCodeWithScope() const {
        RawJavaScriptCodeWithScopeRef cws = currentScalar().asJavaScriptCodeWithScope();
        return JavaScriptCodeWithScope{ownedText(cws.code), Document::fromRaw(cws.scope, depth() + 1)};
    }


    // Iterates a document's elements, with lossy key decoding if enabled.
    template <class Fn>
    static void eachElement(RawDocument doc, bool lossy, Fn fn) {
        for (RawIter i(doc, lossy); i; ++i) {
            if (lossy && !IsValidUTF8(i->keyBytes())) {
                string key = ReplaceInvalidUTF8(i->keyBytes());
                fn(string_view(key), *i);
            } else {
                fn(i->key(), *i);
            }
        }
    }


    void RawDeserializer::iterateDocument(const DocumentCallback &fn) {
        RawDocument doc = _element.value().asDocument();
        eachElement(doc, isUtf8Lossy(), [&](string_view key, const RawElement &elem) {
            RawDeserializer child(elem, childOptions(), depth() + 1);
            fn(key, child);
        });
    }


    void RawDeserializer::iterateArray(const ArrayCallback &fn) {
        RawDocument doc = _element.value().asArray().asDocument();
        size_t index = 0;
        eachElement(doc, isUtf8Lossy(), [&](string_view, const RawElement &elem) {
            RawDeserializer child(elem, childOptions(), depth() + 1);
            fn(index++, child);
        });
    }

}
