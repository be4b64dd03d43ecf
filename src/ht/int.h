#pragma once

// Core integer aliases used across the halftone library.
// Host builds only, so these map straight onto <stdint.h>.

#include <stddef.h>
#include <stdint.h>

namespace ht {

typedef int8_t i8;
typedef uint8_t u8;
typedef int16_t i16;
typedef uint16_t u16;
typedef int32_t i32;
typedef uint32_t u32;
typedef int64_t i64;
typedef uint64_t u64;
typedef size_t size;

} // namespace ht
