//
// DateFormat.cc
//
// Copyright 2023-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "DateFormat.hh"
#include "BosonException.hh"
#include "slice_stream.hh"
#include "date/date.h"
#include <stdio.h>

namespace boson {
    using namespace std::chrono;

    using time_point = std::chrono::time_point<system_clock, milliseconds>;


    std::string DateFormat::formatRFC3339(int64_t timestamp) {
        throwIf(!inRange(timestamp), DateTimeRange,
                "%lld ms is outside the years 0000-9999", (long long)timestamp);

        const time_point tp{milliseconds{timestamp}};
        const auto       td = date::floor<date::days>(tp);

        const date::year_month_day ymd{td};
        const date::hh_mm_ss       hms{date::floor<milliseconds>(tp - td)};

        char buf[32];
        int len = snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                           int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                           int(hms.hours().count()), int(hms.minutes().count()),
                           int(hms.seconds().count()));
        std::string result(buf, size_t(len));
        if (auto ms = hms.subseconds().count(); ms != 0) {
            snprintf(buf, sizeof(buf), ".%03d", int(ms));
            result += buf;
        }
        result += 'Z';
        return result;
    }


    // Reads a 2-digit field followed by `delim`.
    static bool readField(slice_istream &in, int &value, uint8_t delim) noexcept {
        return in.readDigits(2, value) && in.readByte() == delim;
    }


    std::optional<int64_t> DateFormat::parseRFC3339(slice str) noexcept {
        slice_istream in(str);

        // - YMD
        int year, month, day;
        if (!in.readDigits(4, year) || in.readByte() != '-' || !readField(in, month, '-')
                || !in.readDigits(2, day))
            return std::nullopt;
        const date::year_month_day ymd{date::year{year}, date::month{unsigned(month)},
                                       date::day{unsigned(day)}};
        if (!ymd.ok())
            return std::nullopt;

        // - SEPARATOR
        uint8_t sep = in.readByte();
        if (sep != 'T' && sep != 't' && sep != ' ')
            return std::nullopt;

        // - HMS
        int hour, minute, second;
        if (!readField(in, hour, ':') || !readField(in, minute, ':') || !in.readDigits(2, second))
            return std::nullopt;
        if (hour > 23 || minute > 59 || second > 59)
            return std::nullopt;

        // - FRACTION
        int64_t millis = 0;
        if (in.peekByte() == '.') {
            in.skip(1);
            int digits = 0;
            while (in.peekByte() >= '0' && in.peekByte() <= '9') {
                int d = in.readByte() - '0';
                if (digits < 3)
                    millis = 10 * millis + d;
                ++digits;
            }
            if (digits == 0)
                return std::nullopt;
            for (; digits < 3; ++digits)
                millis *= 10;
        }

        // - TIMEZONE
        int64_t offsetMinutes = 0;
        uint8_t tz = in.readByte();
        if (tz == '+' || tz == '-') {
            int tzHour, tzMinute;
            if (!readField(in, tzHour, ':') || !in.readDigits(2, tzMinute))
                return std::nullopt;
            if (tzHour > 23 || tzMinute > 59)
                return std::nullopt;
            offsetMinutes = tzHour * 60 + tzMinute;
            if (tz == '-')
                offsetMinutes = -offsetMinutes;
        } else if (tz != 'Z' && tz != 'z') {
            return std::nullopt;
        }
        if (!in.eof())
            return std::nullopt;

        const int64_t days = date::sys_days{ymd}.time_since_epoch().count();
        return days * 86400000
             + int64_t(hour) * 3600000 + int64_t(minute) * 60000 + int64_t(second) * 1000
             + millis
             - offsetMinutes * 60000;
    }

}
