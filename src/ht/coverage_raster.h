#pragma once

#include "ht/geometry.h"
#include "ht/grid.h"
#include "ht/int.h"

namespace ht {

// 8-bit coverage of one layer's dots. Writes combine by max, so overlapping
// dots of the same layer never accumulate into each other.
class CoverageRaster {
  public:
    CoverageRaster() = default;
    CoverageRaster(u32 width, u32 height) { reset(width, height); }
    CoverageRaster(const CoverageRaster &) = delete;
    CoverageRaster &operator=(const CoverageRaster &) = delete;

    void reset(u32 width, u32 height) { mGrid.reset(width, height); }
    void clear() { mGrid.clear(); }

    u32 width() const { return mGrid.width(); }
    u32 height() const { return mGrid.height(); }
    rect<i32> bounds() const {
        return rect<i32>(0, 0, static_cast<i32>(width()),
                         static_cast<i32>(height()));
    }

    u8 &at(u32 x, u32 y) { return mGrid.at(x, y); }
    const u8 &at(u32 x, u32 y) const { return mGrid.at(x, y); }

    // Max-combines `value` into (x, y). Out of range writes are ignored.
    void plot(i32 x, i32 y, u8 value) {
        if (!mGrid.has(x, y)) {
            return;
        }
        u8 &cell = mGrid.at(static_cast<u32>(x), static_cast<u32>(y));
        if (value > cell) {
            cell = value;
        }
    }

    // Number of pixels with any coverage.
    u32 coveredPixels() const;

    // Inlined, yet customizable drawing access. Only pixels that something
    // wrote to are sent to the visitor.
    template <typename XYVisitor> void draw(XYVisitor &visitor) const {
        const u32 w = width();
        const u32 h = height();
        for (u32 y = 0; y < h; ++y) {
            for (u32 x = 0; x < w; ++x) {
                u8 value = mGrid.at(x, y);
                if (value > 0) { // Something wrote here.
                    visitor.draw(vec2<u32>(x, y), value);
                }
            }
        }
    }

  private:
    Grid<u8> mGrid;
};

} // namespace ht
