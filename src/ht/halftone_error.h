#pragma once

#include "ht/int.h"
#include "ht/result.h"

namespace ht {

/// Call-level failures of the halftone engine. Per-sample rejections are not
/// errors; they are counted in HalftoneStats.
enum class HalftoneError : u8 {
    OK,
    INVALID_PARAMETER,    ///< bad settings or job; nothing was drawn
    SOURCE_IMAGE_MISSING, ///< no source image, or an empty one
    CANCELLED,            ///< cancellation hook or time budget tripped
};

const char *toString(HalftoneError error);

template <typename T> using HalftoneResult = Result<T, HalftoneError>;

} // namespace ht
