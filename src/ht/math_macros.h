#pragma once

#include <math.h>

namespace ht {

// Fun fact, we can't define any function by the name of min,max because
// on some platforms these are macros. Therefore we can only use ht_min and
// ht_max.
template <typename T> constexpr inline T ht_min(T a, T b) {
    return (a < b) ? a : b;
}

template <typename T> constexpr inline T ht_max(T a, T b) {
    return (a > b) ? a : b;
}

} // namespace ht

#ifndef HT_MAX
#define HT_MAX(a, b) ht::ht_max(a, b)
#endif

#ifndef HT_MIN
#define HT_MIN(a, b) ht::ht_min(a, b)
#endif

#ifndef HT_PI
#define HT_PI 3.1415926535897932384626433832795
#endif
