//
// Writer.hh
//
// Copyright 2015-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "boson/slice.hh"
#include "Endian.hh"
#include <vector>

namespace boson {

    /// A simple write-only stream that buffers its output into a byte vector, with the
    /// primitive encodings BSON is made of.
    class Writer {
    public:
        static constexpr size_t kDefaultInitialCapacity = 256;

        explicit Writer(size_t initialCapacity =kDefaultInitialCapacity) {
            _out.reserve(initialCapacity);
        }

        Writer(Writer&&) noexcept = default;
        Writer& operator= (Writer&&) noexcept = default;

        /// The number of bytes written.
        size_t length() const noexcept                  {return _out.size();}

        //-------- Writing:

        void write(const void* data, size_t length) {
            auto bytes = (const uint8_t*)data;
            _out.insert(_out.end(), bytes, bytes + length);
        }
        void write(slice s)                             {write(s.buf, s.size);}

        void writeByte(uint8_t byte)                    {_out.push_back(byte);}

        Writer& operator<< (uint8_t byte)               {writeByte(byte); return *this;}
        Writer& operator<< (slice s)                    {write(s); return *this;}

        template <class T>
        void writeLittle(T n) {
            uint8_t buf[sizeof(T)];
            endian::encodeLittle(n, buf);
            write(buf, sizeof(T));
        }

        void writeInt32(int32_t n)                      {writeLittle(n);}
        void writeUInt32(uint32_t n)                    {writeLittle(n);}
        void writeInt64(int64_t n)                      {writeLittle(n);}
        void writeDouble(double n)                      {writeLittle(n);}

        /// Writes a NUL-terminated string. Throws `InvalidCString` (and writes nothing) if `s`
        /// itself contains a NUL byte.
        void writeCString(slice s);

        /// Writes a BSON string: an int32 length (including the terminator), the bytes, and a NUL.
        void writeString(slice s);

        //-------- Length prefixes:

        /// Writes a placeholder int32 length prefix; returns its position for \ref endLengthPrefix.
        size_t beginLengthPrefix()                      {size_t pos = length(); writeInt32(0); return pos;}

        /// Patches the length prefix at `pos` with the number of bytes written since.
        /// Throws `MalformedValue` if that's larger than an int32 can represent.
        void endLengthPrefix(size_t pos);

        /// Overwrites the int32 at `pos`.
        void patchInt32(size_t pos, int32_t n) noexcept {endian::encodeLittle(n, &_out[pos]);}

        //-------- Accessing the output:

        slice output() const noexcept                   {return slice(_out);}

        /// Returns the data written, and resets.
        std::vector<uint8_t> finish()                   {return std::move(_out);}

    private:
        std::vector<uint8_t> _out;
    };

}
