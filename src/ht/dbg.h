#pragma once

#include <sstream>

#include "ht/io.h"

namespace ht {
// ".build/src/ht/dbg.h" -> "src/ht/dbg.h"
// "blah/blah/blah.h" -> "blah.h"
inline const char *halftone_file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p; // Skip past "src/"
        }
        if (*p == '/') { // fallback to using last slash
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace ht

// Builds a line from a stream expression and hands it to ht::println.
#define HT_PRINT_STREAM(X)                                                     \
    do {                                                                       \
        std::ostringstream _ht_line;                                           \
        _ht_line << X;                                                         \
        ht::println(_ht_line.str().c_str());                                   \
    } while (0)

#if !defined(NDEBUG) || defined(HALFTONE_TESTING)
#define HALFTONE_FORCE_DBG 1
#endif

#ifndef HALFTONE_FORCE_DBG
#define HALFTONE_HAS_DBG 0
#define _HALFTONE_DBG(X)                                                       \
    do {                                                                       \
        if (false) {                                                           \
            HT_PRINT_STREAM(X);                                                \
        }                                                                      \
    } while (0)
#else
#define HALFTONE_HAS_DBG 1
#define _HALFTONE_DBG(X)                                                       \
    HT_PRINT_STREAM((ht::halftone_file_offset(__FILE__))                       \
                    << "(" << int(__LINE__) << "): " << X)
#endif

#define HT_DBG(X) _HALFTONE_DBG(X)

#ifndef HT_DBG_IF
#define HT_DBG_IF(COND, MSG)                                                   \
    if (COND)                                                                  \
    HT_DBG(MSG)
#endif

// Swallows the stream expression but keeps it compiling.
#define HT_DBG_NO_OP(X)                                                        \
    do {                                                                       \
        if (false) {                                                           \
            HT_PRINT_STREAM(X);                                                \
        }                                                                      \
    } while (0)
