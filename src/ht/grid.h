#pragma once

#include <vector>

#include "ht/geometry.h"
#include "ht/int.h"

namespace ht {

// Row-major 2D buffer. Out of range access returns a shared null cell instead
// of touching memory outside the buffer.
template <typename T> class Grid {
  public:
    Grid() = default;

    Grid(u32 width, u32 height) { reset(width, height); }

    void reset(u32 width, u32 height) {
        if (width != mWidth || height != mHeight) {
            mWidth = width;
            mHeight = height;
            mData.resize(static_cast<ht::size>(width) * height);
        }
        clear();
    }

    void clear() { fill(T()); }

    void fill(const T &value) {
        for (ht::size i = 0; i < mData.size(); ++i) {
            mData[i] = value;
        }
    }

    bool has(i32 x, i32 y) const {
        return x >= 0 && y >= 0 && static_cast<u32>(x) < mWidth &&
               static_cast<u32>(y) < mHeight;
    }

    T &at(u32 x, u32 y) { return access(x, y); }
    const T &at(u32 x, u32 y) const { return access(x, y); }

    u32 width() const { return mWidth; }
    u32 height() const { return mHeight; }

    T *data() { return mData.data(); }
    const T *data() const { return mData.data(); }

    ht::size size() const { return mData.size(); }

    bool operator==(const Grid &other) const {
        return mWidth == other.mWidth && mHeight == other.mHeight &&
               mData == other.mData;
    }
    bool operator!=(const Grid &other) const { return !(*this == other); }

  private:
    static T &NullValue() {
        static T gNull;
        return gNull;
    }
    T &access(u32 x, u32 y) {
        if (x < mWidth && y < mHeight) {
            return mData[static_cast<ht::size>(y) * mWidth + x];
        } else {
            return NullValue(); // safe.
        }
    }
    const T &access(u32 x, u32 y) const {
        if (x < mWidth && y < mHeight) {
            return mData[static_cast<ht::size>(y) * mWidth + x];
        } else {
            return NullValue(); // safe.
        }
    }
    std::vector<T> mData;
    u32 mWidth = 0;
    u32 mHeight = 0;
};

} // namespace ht
