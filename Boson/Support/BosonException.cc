//
// BosonException.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "BosonException.hh"
#include <memory>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>

namespace boson {

    static const char* const kErrorNames[] = {
        "",
        "memory error",
        "index or iterator out of range",
        "malformed BSON",
        "invalid UTF-8",
        "unknown element type",
        "nesting depth limit exceeded",
        "invalid C string",
        "lossy conversion",
        "DateTime out of range",
        "invalid UUID subtype",
        "invalid hex string",
        "invalid date string",
        "serialization error",
        "deserialization error",
        "value not present",
        "unexpected value type",
        "internal Boson library error",
    };


    BosonException::BosonException(ErrorCode code_, const std::string &what)
    :std::runtime_error(what)
    ,code(code_)
    ,_message(what)
    ,_what(what)
    { }


    __cold
    static std::string formatMessage(ErrorCode code, const char *what, va_list args) {
        std::string message = kErrorNames[code];
        if (what) {
            char *msg;
            int len = vasprintf(&msg, what, args);
            if (len >= 0) {
                message += std::string(": ") + msg;
                free(msg);
            }
        }
        return message;
    }


    __cold
    void BosonException::_throw(ErrorCode code, const char *what, ...) {
        va_list args;
        va_start(args, what);
        std::string message = formatMessage(code, what, args);
        va_end(args);
        throw BosonException(code, message);
    }


    __cold
    void BosonException::_throwAt(ErrorCode code, size_t offset, const char *what, ...) {
        va_list args;
        va_start(args, what);
        std::string message = formatMessage(code, what, args);
        va_end(args);
        message += " (at offset " + std::to_string(offset) + ")";
        BosonException x(code, message);
        x.offset = offset;
        throw x;
    }


    void BosonException::prependPathKey(const std::string &key) {
        if (_path.empty() || _path[0] == '[')
            _path = key + _path;
        else
            _path = key + "." + _path;
        updateWhat();
    }


    void BosonException::prependPathIndex(size_t index) {
        std::string component = "[" + std::to_string(index) + "]";
        if (_path.empty() || _path[0] == '[')
            _path = component + _path;
        else
            _path = component + "." + _path;
        updateWhat();
    }


    void BosonException::updateWhat() {
        _what = _message + " (at path \"" + _path + "\")";
    }


    __cold
    ErrorCode BosonException::getCode(const std::exception &x) noexcept {
        auto bosonx = dynamic_cast<const BosonException*>(&x);
        if (bosonx)
            return bosonx->code;
        else if (nullptr != dynamic_cast<const std::bad_alloc*>(&x))
            return MemoryError;
        else
            return InternalError;
    }

}
