#pragma once

#include "ht/dbg.h"

#ifndef HT_WARN
#define HT_WARN(X) HT_PRINT_STREAM("WARN: " << X)
#define HT_WARN_IF(COND, MSG)                                                  \
    do {                                                                       \
        if (COND)                                                              \
            HT_WARN(MSG);                                                      \
    } while (0)
#endif
