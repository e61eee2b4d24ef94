//
// NumConversion.cc
//
// Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "NumConversion.hh"
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace boson {

    // 2^64, the smallest double that doesn't fit in a uint64_t.
    static constexpr double kTwoToThe64 = 18446744073709551616.0;


    std::optional<double> ExactDouble(uint64_t val) noexcept {
        if (val == UINT64_MAX)
            return std::nullopt;
        double d = double(val);
        // Values just below 2^64 round up to it; casting that back would be undefined.
        if (d >= kTwoToThe64)
            return std::nullopt;
        if (uint64_t(d) != val)
            return std::nullopt;
        return d;
    }


    std::optional<double> ExactDoubleFromInt64(int64_t val) noexcept {
        if (val >= 0)
            return ExactDouble(uint64_t(val));
        // Magnitude computed without overflowing on INT64_MIN:
        uint64_t magnitude = uint64_t(-(val + 1)) + 1;
        auto d = ExactDouble(magnitude);
        if (!d)
            return std::nullopt;
        return -*d;
    }


    std::optional<uint32_t> ExactUInt32(double f) noexcept {
        if (!(f > -1.0 && f < 4294967296.0))        // also rejects NaN
            return std::nullopt;
        auto n = uint32_t(std::max(f, 0.0));
        if (std::fabs(f - double(n)) > DBL_EPSILON)
            return std::nullopt;
        return n;
    }


    std::optional<uint64_t> ExactUInt64(double f) noexcept {
        if (!(f > -1.0 && f < kTwoToThe64))
            return std::nullopt;
        auto n = uint64_t(std::max(f, 0.0));
        if (std::fabs(f - double(n)) > DBL_EPSILON)
            return std::nullopt;
        return n;
    }

}
