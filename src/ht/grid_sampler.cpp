#include "ht/grid_sampler.h"

#include <math.h>

#include "ht/raster_image.h"

namespace ht {

namespace {
u64 stepsAcross(i32 min, i32 max, i32 step) {
    if (max <= min) {
        return 0;
    }
    const i64 span = static_cast<i64>(max) - min;
    return static_cast<u64>((span + step - 1) / step);
}
} // namespace

GridSampler::GridSampler(const GridBounds &bounds, i32 dot_resolution,
                         float degrees, const RasterImage &source,
                         AnchorStrategy anchor)
    : mBounds(bounds), mStep(dot_resolution < 1 ? 1 : dot_resolution),
      mSource(source), mAnchor(anchor),
      mCenter(source.width() / 2.0f, source.height() / 2.0f), mX(bounds.mMin.x),
      mY(bounds.mMin.y) {
    // Inverse rotation: grid space -> source space.
    const float radians = -toRadians(normalizeAngle(degrees));
    mCos = cosf(radians);
    mSin = sinf(radians);
    mDone = bounds.mMax.x <= bounds.mMin.x || bounds.mMax.y <= bounds.mMin.y;
}

u64 GridSampler::cellCount() const {
    return stepsAcross(mBounds.mMin.x, mBounds.mMax.x, mStep) *
           stepsAcross(mBounds.mMin.y, mBounds.mMax.y, mStep);
}

bool GridSampler::next(DotSample *out) {
    if (mDone) {
        return false;
    }
    sampleAt(mX, mY, out);

    // Step in 64 bits; a step near INT32_MAX must not wrap.
    const i64 next_x = static_cast<i64>(mX) + mStep;
    if (next_x < mBounds.mMax.x) {
        mX = static_cast<i32>(next_x);
        return true;
    }
    mX = mBounds.mMin.x;
    ++mRowsCompleted;
    const i64 next_y = static_cast<i64>(mY) + mStep;
    if (next_y < mBounds.mMax.y) {
        mY = static_cast<i32>(next_y);
    } else {
        mDone = true;
    }
    return true;
}

void GridSampler::sampleAt(i32 gx, i32 gy, DotSample *out) const {
    const vec2f grid_point(static_cast<float>(gx), static_cast<float>(gy));
    const float dx = grid_point.x - mCenter.x;
    const float dy = grid_point.y - mCenter.y;
    const vec2f sample_point(dx * mCos - dy * mSin + mCenter.x,
                             dx * mSin + dy * mCos + mCenter.y);

    out->grid = vec2i32(gx, gy);
    out->sample_point = sample_point;
    out->anchor = anchorPoint(mAnchor, grid_point, sample_point);
    out->luminance = 0.0f;

    // Dropped, never clamped.
    const float w = static_cast<float>(mSource.width());
    const float h = static_cast<float>(mSource.height());
    if (sample_point.x < 0.0f || sample_point.y < 0.0f ||
        sample_point.x >= w || sample_point.y >= h) {
        out->status = SampleStatus::kOutOfBounds;
        return;
    }

    const u32 px = static_cast<u32>(floorf(sample_point.x));
    const u32 py = static_cast<u32>(floorf(sample_point.y));
    if (px >= mSource.width() || py >= mSource.height()) {
        // x just below w can floor onto w after float rounding.
        out->status = SampleStatus::kOutOfBounds;
        return;
    }
    const RGBA8 &pixel = mSource.at(px, py);
    if (pixel.isTransparent()) {
        out->status = SampleStatus::kTransparent;
        return;
    }
    out->luminance = pixel.luminance();
    out->status = SampleStatus::kAccepted;
}

} // namespace ht
