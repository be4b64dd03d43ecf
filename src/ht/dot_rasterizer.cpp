#include "ht/dot_rasterizer.h"

#include <math.h>

#include "ht/clamp.h"
#include "ht/coverage_raster.h"
#include "ht/map_range.h"

namespace ht {

float dotRadius(float luminance, float dot_size, bool invert) {
    const float max_radius = dot_size / 2.0f;
    const float l = clamp(luminance, 0.0f, 255.0f);
    if (invert) {
        return map_range<float, float>(l, 0.0f, 255.0f, 0.0f, max_radius);
    }
    return map_range<float, float>(l, 0.0f, 255.0f, max_radius, 0.0f);
}

DotRasterizer::DotRasterizer(CoverageRaster *target, int supersample)
    : mTarget(target), mScale(supersample < 1 ? 1 : supersample) {}

bool DotRasterizer::drawDot(const vec2f &anchor, float radius) {
    if (!isVisibleRadius(radius)) {
        return false;
    }
    const float s = static_cast<float>(mScale);
    fillCircle(anchor.x * s, anchor.y * s, radius * s);
    return true;
}

void DotRasterizer::fillCircle(float cx, float cy, float r) {
    // Coverage ramps from 1 to 0 across a one pixel band centered on the
    // circle edge, measured from pixel centers.
    const vec2f center(cx, cy);
    const rect<i32> clip = mTarget->bounds();
    // Clip in float first: a huge radius would not fit in an i32.
    const float min_x = static_cast<float>(clip.mMin.x);
    const float min_y = static_cast<float>(clip.mMin.y);
    const float max_x = static_cast<float>(clip.mMax.x);
    const float max_y = static_cast<float>(clip.mMax.y);
    const i32 x0 = static_cast<i32>(
        floorf(clamp(cx - r - 1.0f, min_x, max_x)));
    const i32 y0 = static_cast<i32>(
        floorf(clamp(cy - r - 1.0f, min_y, max_y)));
    const i32 x1 = static_cast<i32>(ceilf(clamp(cx + r + 1.0f, min_x, max_x)));
    const i32 y1 = static_cast<i32>(ceilf(clamp(cy + r + 1.0f, min_y, max_y)));

    for (i32 y = y0; y < y1; ++y) {
        const float py = static_cast<float>(y) + 0.5f;
        for (i32 x = x0; x < x1; ++x) {
            const vec2f pixel_center(static_cast<float>(x) + 0.5f, py);
            const float d = pixel_center.distance(center);
            const float coverage = clamp(r + 0.5f - d, 0.0f, 1.0f);
            if (coverage <= 0.0f) {
                continue;
            }
            const u8 value = static_cast<u8>(coverage * 255.0f + 0.5f);
            mTarget->plot(x, y, value);
        }
    }
}

} // namespace ht
