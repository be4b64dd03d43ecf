#pragma once

#include "ht/geometry.h"
#include "ht/int.h"
#include "ht/raster_image.h"
#include "ht/rgba8.h"

namespace ht {

// Draws a coverage value onto a RasterImage in a solid color. Full coverage
// replaces the pixel; partial coverage (anti-aliased edges) mixes with what is
// already underneath.
struct XYDrawCoverage {
    XYDrawCoverage(const RGBA8 &color, RasterImage *out)
        : mColor(color), mOut(out) {}

    XYDrawCoverage(const XYDrawCoverage &other) = default;
    XYDrawCoverage &operator=(const XYDrawCoverage &other) = delete;

    void draw(const vec2<u32> &pt, u8 value) {
        RGBA8 &c = mOut->at(pt.x, pt.y);
        c = c.blendOver(mColor, value);
        ++mPixelsWritten;
    }

    u32 pixelsWritten() const { return mPixelsWritten; }

    const RGBA8 mColor;
    RasterImage *mOut;
    u32 mPixelsWritten = 0;
};

} // namespace ht
