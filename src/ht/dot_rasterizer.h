#pragma once

#include "ht/geometry.h"
#include "ht/halftone_config.h"
#include "ht/int.h"

namespace ht {

class CoverageRaster;

// Luminance -> dot radius in output units. Dark pixels get large dots and
// bright pixels small ones unless `invert` is set:
//
//   invert == false: 0 -> dot_size / 2, 255 -> 0
//   invert == true:  0 -> 0,            255 -> dot_size / 2
//
// Both end points are exact, so radius(L, true) + radius(L, false) equals
// dot_size / 2.
float dotRadius(float luminance, float dot_size, bool invert);

// Radii at or below HALFTONE_MIN_DOT_RADIUS are below the visible threshold
// and are not drawn.
inline bool isVisibleRadius(float radius) {
    return radius > HALFTONE_MIN_DOT_RADIUS;
}

// Draws anti-aliased filled circles into a coverage raster that is
// `supersample` times the nominal output size. Centers and radii are given in
// nominal output units.
class DotRasterizer {
  public:
    DotRasterizer(CoverageRaster *target, int supersample);

    // Draws the dot and returns true, or returns false when the radius is
    // below the visible threshold.
    bool drawDot(const vec2f &anchor, float radius);

    int supersample() const { return mScale; }

  private:
    void fillCircle(float cx, float cy, float r);

    CoverageRaster *mTarget;
    int mScale;
};

} // namespace ht
