#pragma once

#include "ht/dbg.h"

#ifndef HT_ERROR
#define HT_ERROR(X) HT_PRINT_STREAM("ERROR: " << X)
#define HT_ERROR_IF(COND, MSG)                                                 \
    do {                                                                       \
        if (COND)                                                              \
            HT_ERROR(MSG);                                                     \
    } while (0)
#endif
