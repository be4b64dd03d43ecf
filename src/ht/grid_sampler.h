#pragma once

#include "ht/anchor_strategy.h"
#include "ht/geometry.h"
#include "ht/int.h"
#include "ht/screen_geometry.h"

namespace ht {

class RasterImage;

enum class SampleStatus : u8 {
    kAccepted = 0,
    kOutOfBounds, // inverse-rotated point fell outside the source
    kTransparent, // source pixel has alpha == 0
};

// One cell of the halftone screen.
struct DotSample {
    vec2i32 grid;          // grid coordinate (gx, gy)
    vec2f sample_point;    // grid coordinate rotated back into the source
    vec2f anchor;          // dot center chosen by the anchor strategy
    float luminance = 0.0f; // [0, 255], only meaningful when accepted
    SampleStatus status = SampleStatus::kOutOfBounds;

    bool accepted() const { return status == SampleStatus::kAccepted; }
};

// Walks the rotated screen one cell at a time. Finite and single pass: once
// next() returns false the sampler stays exhausted.
//
//  GridSampler sampler(bounds, 8, 45.0f, source, AnchorStrategy::kTraditional);
//  DotSample sample;
//  while (sampler.next(&sample)) {
//      if (sample.accepted()) { ... }
//  }
class GridSampler {
  public:
    GridSampler(const GridBounds &bounds, i32 dot_resolution, float degrees,
                const RasterImage &source, AnchorStrategy anchor);

    // Fills `out` with the next cell. Rejected cells are still reported (with
    // a non-accepted status) so callers can count them.
    bool next(DotSample *out);

    bool done() const { return mDone; }

    // Number of grid rows fully walked so far.
    u32 rowsCompleted() const { return mRowsCompleted; }

    // Total cells this sampler will visit.
    u64 cellCount() const;

    const GridBounds &bounds() const { return mBounds; }

  private:
    void sampleAt(i32 gx, i32 gy, DotSample *out) const;

    GridBounds mBounds;
    i32 mStep;
    const RasterImage &mSource;
    AnchorStrategy mAnchor;
    vec2f mCenter;
    float mCos;
    float mSin;
    i32 mX;
    i32 mY;
    u32 mRowsCompleted = 0;
    bool mDone;
};

} // namespace ht
