//
// ObjectId.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ObjectId.hh"
#include "BosonException.hh"
#include "Endian.hh"
#include "betterassert.hh"
#include <atomic>
#include <chrono>
#include <random>

namespace boson {

    static constexpr uint32_t kMaxCounter = 0xFFFFFF;


    // Per-process state used by generate(): a random 5-byte value and a counter that starts at a
    // random value.
    namespace {
        struct ProcessState {
            uint8_t               salt[5];
            std::atomic<uint32_t> counter;

            ProcessState() {
                std::random_device rd;
                std::mt19937_64 rng(((uint64_t)rd() << 32) | rd());
                uint64_t r = rng();
                for (int i = 0; i < 5; ++i)
                    salt[i] = uint8_t(r >> (8 * i));
                counter = uint32_t(rng()) & kMaxCounter;
            }
        };

        ProcessState& processState() {
            static ProcessState sState;
            return sState;
        }
    }


    ObjectId ObjectId::fromBytes(slice s) {
        precondition(s.size == kSize);
        Bytes b;
        s.copyTo(b.data());
        return ObjectId(b);
    }


    ObjectId ObjectId::generate() {
        auto &state = processState();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch()).count();
        uint32_t count = state.counter.fetch_add(1) & kMaxCounter;

        Bytes b;
        endian::encodeBig32(uint32_t(secs), &b[0]);
        memcpy(&b[4], state.salt, 5);
        b[9]  = uint8_t(count >> 16);
        b[10] = uint8_t(count >> 8);
        b[11] = uint8_t(count);
        return ObjectId(b);
    }


    ObjectId ObjectId::parse(slice hex) {
        Bytes b;
        if (!decodeHex(hex, b.data(), kSize))
            BosonException::_throw(InvalidHex, "not a 24-digit hex ObjectId: \"%.*s\"",
                                   FMTSLICE(hex));
        return ObjectId(b);
    }


    uint32_t ObjectId::timestamp() const noexcept {
        return endian::decodeBig32(&_bytes[0]);
    }

}
