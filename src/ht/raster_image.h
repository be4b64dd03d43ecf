#pragma once

#include <vector>

#include "ht/geometry.h"
#include "ht/grid.h"
#include "ht/int.h"
#include "ht/rgba8.h"

namespace ht {

// Row-major RGBA8888 image with a top-left origin. This is the only pixel
// container that crosses the engine boundary: sources come in as
// RasterImage and rendered output goes back out as one.
class RasterImage {
  public:
    RasterImage() = default;
    RasterImage(u32 width, u32 height) : mPixels(width, height) {}
    RasterImage(u32 width, u32 height, const RGBA8 &fill)
        : mPixels(width, height) {
        mPixels.fill(fill);
    }

    // Copies width * height * 4 bytes laid out as R, G, B, A.
    static RasterImage FromRGBA(u32 width, u32 height, const u8 *bytes);

    u32 width() const { return mPixels.width(); }
    u32 height() const { return mPixels.height(); }
    bool empty() const { return width() == 0 || height() == 0; }
    rect<i32> bounds() const {
        return rect<i32>(0, 0, static_cast<i32>(width()),
                         static_cast<i32>(height()));
    }

    bool has(i32 x, i32 y) const { return mPixels.has(x, y); }

    RGBA8 &at(u32 x, u32 y) { return mPixels.at(x, y); }
    const RGBA8 &at(u32 x, u32 y) const { return mPixels.at(x, y); }

    void fill(const RGBA8 &color) { mPixels.fill(color); }

    RGBA8 *data() { return mPixels.data(); }
    const RGBA8 *data() const { return mPixels.data(); }

    // Flattens back to R, G, B, A bytes for encoders.
    std::vector<u8> toRGBA() const;

    bool operator==(const RasterImage &other) const {
        return mPixels == other.mPixels;
    }
    bool operator!=(const RasterImage &other) const {
        return !(*this == other);
    }

  private:
    Grid<RGBA8> mPixels;
};

} // namespace ht
