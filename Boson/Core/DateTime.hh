//
// DateTime.hh
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
#include "boson/slice.hh"
#include <string>

namespace boson {

    /** A UTC date-time: a signed count of milliseconds since 1/1/1970.
        Every int64_t value is valid, including ones far outside the range a calendar can
        express; only the RFC 3339 conversions are restricted to the years 0000-9999. */
    class DateTime {
    public:
        constexpr DateTime() noexcept                           :_millis(0) { }

        static constexpr DateTime fromMillis(int64_t ms) noexcept {return DateTime(ms);}

        /// The current time, truncated to milliseconds.
        static DateTime now();

        /// The earliest and latest representable times.
        static const DateTime kMin, kMax;

        constexpr int64_t timestampMillis() const noexcept      {return _millis;}

        /// Formats as RFC 3339 in UTC. Throws `DateTimeRange` if the year isn't in 0000-9999.
        std::string toRfc3339() const;

        /// Parses an RFC 3339 string. Throws `InvalidDateString` if it's malformed.
        static DateTime parseRfc3339(slice);

        constexpr bool operator== (DateTime d) const noexcept   {return _millis == d._millis;}
        constexpr bool operator!= (DateTime d) const noexcept   {return _millis != d._millis;}
        constexpr bool operator< (DateTime d) const noexcept    {return _millis < d._millis;}

    private:
        explicit constexpr DateTime(int64_t ms) noexcept        :_millis(ms) { }

        int64_t _millis;
    };

}
