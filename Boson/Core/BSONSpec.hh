//
// BSONSpec.hh
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
#include "boson/PlatformCompat.hh"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace boson {

    /** Element type tags, as they appear on the wire. */
    enum class ElementType : uint8_t {
        Double                  = 0x01,
        String                  = 0x02,
        EmbeddedDocument        = 0x03,
        Array                   = 0x04,
        Binary                  = 0x05,
        Undefined               = 0x06,
        ObjectId                = 0x07,
        Boolean                 = 0x08,
        DateTime                = 0x09,
        Null                    = 0x0A,
        RegularExpression       = 0x0B,
        DbPointer               = 0x0C,
        JavaScriptCode          = 0x0D,
        Symbol                  = 0x0E,
        JavaScriptCodeWithScope = 0x0F,
        Int32                   = 0x10,
        Timestamp               = 0x11,
        Int64                   = 0x12,
        Decimal128              = 0x13,
        MaxKey                  = 0x7F,
        MinKey                  = 0xFF,
    };

    /** Returns the ElementType for a tag byte, or nullopt if it isn't a known tag. */
    std::optional<ElementType> ElementTypeFromByte(uint8_t) noexcept BOSON_CONST;

    /** A human-readable name of a type, for error messages. */
    const char* ElementTypeName(ElementType) noexcept BOSON_CONST;


    /** Binary data subtypes. Subtypes 0x80-0xFF are user-defined; any other unlisted value is
        reserved and preserved as-is. */
    enum class BinarySubtype : uint8_t {
        Generic     = 0x00,
        Function    = 0x01,
        BinaryOld   = 0x02,
        UuidOld     = 0x03,
        Uuid        = 0x04,
        Md5         = 0x05,
        Encrypted   = 0x06,
        Column      = 0x07,
        Sensitive   = 0x08,
        UserDefined = 0x80,         // The first user-defined value
    };

    static inline bool IsUserDefined(BinarySubtype s) noexcept {return uint8_t(s) >= 0x80;}


    /// Size of the smallest possible document: a length prefix and a terminator.
    static constexpr size_t kMinDocumentSize = 5;

    /// Maximum size of an encoded document (the length prefix is a signed 32-bit int.)
    static constexpr size_t kMaxDocumentSize = INT32_MAX;

    /// Fixed ceiling on nesting depth of documents and arrays when decoding or encoding
    /// recursively.
    static constexpr unsigned kMaxNestingDepth = 100;

}
