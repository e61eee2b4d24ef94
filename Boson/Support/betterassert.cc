//
// betterassert.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "betterassert.hh"
#include <stdio.h>
#include <string.h>
#include <string>

namespace boson {
    using namespace std;


    // Strips the directories from a __FILE__ path.
    __cold
    static const char* baseName(const char *file) {
        const char *slash = strrchr(file, '/');
        if (!slash)
            slash = strrchr(file, '\\');
        return slash ? slash + 1 : file;
    }


    // Formats the failure message and writes it to stderr.
    __cold
    static string report(const char *kind, const char *cond, const char *fn,
                         const char *file, int line)
    {
        char msg[1024];
        snprintf(msg, sizeof(msg), "FAILED %s: `%s` in %s (at %s line %d)",
                 kind, cond, (fn ? fn : ""), baseName(file), line);
        fprintf(stderr, "%s\n", msg);
        return msg;
    }


    __cold
    void _precondition_failed(const char *cond, const char *fn, const char *file, int line) {
        throw invalid_argument(report("PRECONDITION", cond, fn, file, line));
    }

    __cold
    void _postcondition_failed(const char *cond, const char *fn, const char *file, int line) {
        throw assertion_failure(report("POSTCONDITION", cond, fn, file, line));
    }

}
