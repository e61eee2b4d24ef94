//
// DateFormat.hh
//
// Copyright 2023-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "boson/slice.hh"
#include <chrono>
#include <optional>
#include <string>

namespace boson {

    class DateFormat {
      public:
        /// Milliseconds since the epoch of 0000-01-01T00:00:00.000Z.
        static constexpr int64_t kMinMillis = -62167219200000;
        /// Milliseconds since the epoch of 9999-12-31T23:59:59.999Z.
        static constexpr int64_t kMaxMillis = 253402300799999;

        /** Formats a timestamp (milliseconds since 1/1/1970) as an RFC 3339 date-time in UTC,
            e.g. "1996-12-20T00:39:57Z". A ".mmm" fraction is written only when the milliseconds
            are nonzero.
            Throws `DateTimeRange` if the year falls outside 0000-9999. */
        static std::string formatRFC3339(int64_t timestamp);

        /** Parses an RFC 3339 date-time: `YYYY-MM-DD`, `T` (or `t` or a space), `hh:mm:ss`,
            an optional fraction of any length (truncated to milliseconds), then `Z` (or `z`)
            or a `+hh:mm` / `-hh:mm` offset.
            Returns the timestamp in milliseconds since 1/1/1970, or nullopt if invalid. */
        static std::optional<int64_t> parseRFC3339(slice str) noexcept;

        /// True if the timestamp can be formatted by \ref formatRFC3339.
        static bool inRange(int64_t timestamp) noexcept {
            return timestamp >= kMinMillis && timestamp <= kMaxMillis;
        }
    };

}
