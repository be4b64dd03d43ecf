#pragma once

#include "ht/int.h"

namespace ht {

class RasterImage;

// Reduces `src` into `dst`, which must already be sized and no larger than
// `src` in either dimension. Every channel, alpha included, is averaged with
// rounding. Returns false (and leaves dst untouched) on a size mismatch.
//
// Picks downscaleHalf() when dst is exactly half of src, downscaleBox() for
// other exact integer factors, and downscaleArbitrary() otherwise.
bool downscale(const RasterImage &src, RasterImage *dst);

// Fast path for 2:1 in both directions.
void downscaleHalf(const RasterImage &src, RasterImage *dst);

// Box filter for an exact integer `factor` in both directions.
void downscaleBox(const RasterImage &src, u32 factor, RasterImage *dst);

// Area-weighted reduction in Q8.8 fixed point for any ratio.
void downscaleArbitrary(const RasterImage &src, RasterImage *dst);

} // namespace ht
