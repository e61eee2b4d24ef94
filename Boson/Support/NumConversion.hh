//
// NumConversion.hh
//
// Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "boson/PlatformCompat.hh"
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace boson {

    /// Converts an integer to another integer type, or returns `nullopt` if the value
    /// can't be represented exactly in the destination type.
    template <typename Out, typename In>
    std::optional<Out> ExactIntCast(In val) noexcept {
        static_assert(std::is_integral<In>::value && std::is_integral<Out>::value,
                      "Only integer types are valid for ExactIntCast");
        if constexpr (std::is_signed<In>::value) {
            if (val < 0) {
                if constexpr (!std::is_signed<Out>::value)
                    return std::nullopt;
                else if (int64_t(val) < int64_t(std::numeric_limits<Out>::min()))
                    return std::nullopt;
                return Out(val);
            }
        }
        if (uint64_t(val) > uint64_t(std::numeric_limits<Out>::max()))
            return std::nullopt;
        return Out(val);
    }


    /// Converts a `uint64_t` to a `double`, or returns `nullopt` if the double can't represent
    /// it exactly. (`UINT64_MAX` never can.)
    std::optional<double> ExactDouble(uint64_t) noexcept;

    /// Converts an `int64_t` to a `double`, or returns `nullopt` if the double can't represent
    /// it exactly.
    std::optional<double> ExactDoubleFromInt64(int64_t) noexcept;

    /// Converts a `double` to a `uint32_t`, or returns `nullopt` if it isn't within
    /// `DBL_EPSILON` of an integer in range.
    std::optional<uint32_t> ExactUInt32(double) noexcept;

    /// Converts a `double` to a `uint64_t`, or returns `nullopt` if it isn't within
    /// `DBL_EPSILON` of an integer in range.
    std::optional<uint64_t> ExactUInt64(double) noexcept;

}
