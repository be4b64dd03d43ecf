#pragma once

#include "ht/halftone_config.h"

namespace ht {

class RasterImage;

// Remaps a luminance so that only shadows survive:
//   L <  HALFTONE_SHADOW_THRESHOLD -> stretched linearly over [0, 255]
//   L >= HALFTONE_SHADOW_THRESHOLD -> 255 (white, draws nothing)
float shadowMaskValue(float luminance);

// Gray image of the same size as `source` holding shadowMaskValue() of every
// pixel, fully opaque. Used as the sampling source of the duotone shadow
// layer.
RasterImage deriveShadowMask(const RasterImage &source);

} // namespace ht
