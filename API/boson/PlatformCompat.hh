//
// PlatformCompat.hh
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
#include "boson/Base.h"

#ifdef _MSC_VER
    #define NOINLINE                        __declspec(noinline)
    #define __printflike(A, B)
#else
    #define NOINLINE                        __attribute((noinline))

    // Type-checks the arguments of a function against its printf-style format string.
    #ifndef __printflike
    #define __printflike(fmtarg, firstvararg) __attribute__((__format__ (__printf__, fmtarg, firstvararg)))
    #endif
#endif
