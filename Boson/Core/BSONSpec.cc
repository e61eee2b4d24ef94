//
// BSONSpec.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "BSONSpec.hh"

namespace boson {

    std::optional<ElementType> ElementTypeFromByte(uint8_t b) noexcept {
        if ((b >= 0x01 && b <= 0x13) || b == 0x7F || b == 0xFF)
            return ElementType(b);
        return std::nullopt;
    }


    const char* ElementTypeName(ElementType type) noexcept {
        switch (type) {
            case ElementType::Double:                   return "double";
            case ElementType::String:                   return "string";
            case ElementType::EmbeddedDocument:         return "document";
            case ElementType::Array:                    return "array";
            case ElementType::Binary:                   return "binary";
            case ElementType::Undefined:                return "undefined";
            case ElementType::ObjectId:                 return "ObjectId";
            case ElementType::Boolean:                  return "boolean";
            case ElementType::DateTime:                 return "DateTime";
            case ElementType::Null:                     return "null";
            case ElementType::RegularExpression:        return "regex";
            case ElementType::DbPointer:                return "DBPointer";
            case ElementType::JavaScriptCode:           return "JavaScript code";
            case ElementType::Symbol:                   return "symbol";
            case ElementType::JavaScriptCodeWithScope:  return "JavaScript code with scope";
            case ElementType::Int32:                    return "int32";
            case ElementType::Timestamp:                return "timestamp";
            case ElementType::Int64:                    return "int64";
            case ElementType::Decimal128:               return "decimal128";
            case ElementType::MaxKey:                   return "max key";
            case ElementType::MinKey:                   return "min key";
        }
        return "unknown";
    }

}
