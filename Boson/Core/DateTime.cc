//
// DateTime.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "DateTime.hh"
#include "DateFormat.hh"
#include "BosonException.hh"
#include <chrono>

namespace boson {

    const DateTime DateTime::kMin = DateTime::fromMillis(INT64_MIN);
    const DateTime DateTime::kMax = DateTime::fromMillis(INT64_MAX);


    DateTime DateTime::now() {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch());
        return DateTime(int64_t(ms.count()));
    }


    std::string DateTime::toRfc3339() const {
        return DateFormat::formatRFC3339(_millis);
    }


    DateTime DateTime::parseRfc3339(slice str) {
        auto ms = DateFormat::parseRFC3339(str);
        if (!ms)
            BosonException::_throw(InvalidDateString, "not an RFC 3339 date-time: \"%.*s\"",
                                   FMTSLICE(str));
        return DateTime(*ms);
    }

}
