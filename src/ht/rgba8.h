#pragma once

#include <ostream>
#include <string>

#include "ht/int.h"
#include "ht/result.h"

namespace ht {

/// Representation of an 8-bit RGBA pixel. Memory layout is r, g, b, a so a
/// buffer of RGBA8 is a row-major RGBA8888 image.
struct RGBA8 {
    u8 r = 0;
    u8 g = 0;
    u8 b = 0;
    u8 a = 0;

    constexpr RGBA8() = default;
    constexpr RGBA8(u8 ir, u8 ig, u8 ib, u8 ia = 255)
        : r(ir), g(ig), b(ib), a(ia) {}

    /// Allow construction from a 0xRRGGBB code, fully opaque
    static constexpr RGBA8 fromCode(u32 colorcode) {
        return RGBA8((colorcode >> 16) & 0xFF, (colorcode >> 8) & 0xFF,
                     (colorcode >> 0) & 0xFF, 255);
    }

    /// Parses "#RRGGBB", "RRGGBB", "#RGB" or "#RRGGBBAA".
    static Result<RGBA8> fromHex(const std::string &text);

    /// Perceptual brightness, 0.299 R + 0.587 G + 0.114 B, in [0, 255].
    float luminance() const {
        return 0.299f * r + 0.587f * g + 0.114f * b;
    }

    bool isTransparent() const { return a == 0; }

    RGBA8 opaque() const { return RGBA8(r, g, b, 255); }

    /// Mixes `over` on top of this color with `amount` in [0, 255]. 255
    /// yields `over` exactly, 0 leaves this color untouched.
    RGBA8 blendOver(const RGBA8 &over, u8 amount) const;

    /// "#RRGGBB" (or "#RRGGBBAA" when not opaque)
    std::string toHex() const;
    std::string toString() const;

    bool operator==(const RGBA8 &rhs) const {
        return r == rhs.r && g == rhs.g && b == rhs.b && a == rhs.a;
    }
    bool operator!=(const RGBA8 &rhs) const { return !(*this == rhs); }

    static constexpr RGBA8 Black() { return RGBA8(0, 0, 0, 255); }
    static constexpr RGBA8 White() { return RGBA8(255, 255, 255, 255); }
    static constexpr RGBA8 Transparent() { return RGBA8(0, 0, 0, 0); }
};

/// Luminance of raw channel values, same weights as RGBA8::luminance().
inline float luminance(u8 r, u8 g, u8 b) {
    return 0.299f * r + 0.587f * g + 0.114f * b;
}

std::ostream &operator<<(std::ostream &os, const RGBA8 &color);

} // namespace ht
