#pragma once

#include "ht/clamp.h"

namespace ht {

namespace map_range_detail {

template <typename T, typename U> struct map_range_math {
    static U map(T value, T in_min, T in_max, U out_min, U out_max) {
        if (in_min == in_max)
            return out_min;
        return out_min +
               (value - in_min) * (out_max - out_min) / (in_max - in_min);
    }
};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wfloat-equal"
template <typename T> inline bool equals(T a, T b) { return a == b; }
#pragma GCC diagnostic pop

} // namespace map_range_detail

// Linear map of value from [in_min, in_max] onto [out_min, out_max]. The end
// points map exactly, so callers can rely on map_range(in_max, ...) == out_max.
template <typename T, typename U>
inline U map_range(T value, T in_min, T in_max, U out_min, U out_max) {
    using namespace map_range_detail;
    if (equals(value, in_min)) {
        return out_min;
    }
    if (equals(value, in_max)) {
        return out_max;
    }
    return map_range_math<T, U>::map(value, in_min, in_max, out_min, out_max);
}

template <typename T, typename U>
inline U map_range_clamped(T value, T in_min, T in_max, U out_min,
                           U out_max) {
    value = clamp(value, in_min, in_max);
    return map_range<T, U>(value, in_min, in_max, out_min, out_max);
}

} // namespace ht
