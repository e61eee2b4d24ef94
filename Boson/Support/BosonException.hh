//
// BosonException.hh
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
#include <optional>
#include <stdexcept>
#include <string>

namespace boson {

    // Error codes. Keep kErrorNames in BosonException.cc in sync with this!
    typedef enum {
        NoError = 0,
        MemoryError,            // Out of memory, or allocation failed
        OutOfRange,             // Array index or iterator out of range
        MalformedValue,         // Truncated data, bad length field, missing terminator
        Utf8Encoding,           // Invalid UTF-8 in a string or key
        UnknownElementType,     // Unrecognized element type tag
        DepthLimitExceeded,     // Documents/arrays nested deeper than kMaxNestingDepth
        InvalidCString,         // Key, regex pattern or options contains a NUL byte
        LossyConversion,        // Numeric conversion that can't be done exactly
        DateTimeRange,          // DateTime can't be expressed as a calendar date
        InvalidUuidSubtype,     // Binary subtype doesn't match the requested UUID representation
        InvalidHex,             // Malformed ObjectId hex string
        InvalidDateString,      // Malformed RFC 3339 string
        SerializationError,     // Structural misuse of a Serializer
        DeserializationError,   // Value doesn't match what the reader expected
        ValueAccessNotPresent,  // Key not found
        ValueAccessUnexpectedType, // Key found, but value has a different type
        InternalError,          // This shouldn't happen
    } ErrorCode;


    class BosonException : public std::runtime_error {
    public:
        BosonException(ErrorCode code_, const std::string &what);

        [[noreturn]] static void _throw(ErrorCode code, const char *what, ...) __printflike(2,3);

        /// Throws an exception that records the byte offset in the input where the error was found.
        [[noreturn]] static void _throwAt(ErrorCode code, size_t offset,
                                          const char *what, ...) __printflike(3,4);

        static ErrorCode getCode(const std::exception&) noexcept;

        /// The message, followed by the path (if any) at which the error occurred.
        const char* what() const noexcept override      {return _what.c_str();}

        /// The dotted path (e.g. "items[2].name") of the value being processed when the error
        /// occurred, or empty if path tracking wasn't enabled.
        const std::string& path() const noexcept        {return _path;}

        /// Adds a document key to the front of the path.
        void prependPathKey(const std::string &key);

        /// Adds an array index to the front of the path.
        void prependPathIndex(size_t index);

        const ErrorCode code;
        std::optional<size_t> offset;   // Byte offset in the input, if known
        std::string key;                // Key of the element being read, if known

    private:
        void updateWhat();

        std::string _message;
        std::string _path;
        std::string _what;
    };

    #define throwIf(BAD, ERROR, MESSAGE, ...) \
     if (_usuallyTrue(!(BAD))) ; else boson::BosonException::_throw(ERROR, MESSAGE, ##__VA_ARGS__)

}
