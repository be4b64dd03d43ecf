#include "ht/downscale.h"

#include "ht/math_macros.h"
#include "ht/raster_image.h"
#include "ht/warn.h"

namespace ht {

void downscaleHalf(const RasterImage &src, RasterImage *dst) {
    const u32 dstWidth = dst->width();
    const u32 dstHeight = dst->height();

    for (u32 y = 0; y < dstHeight; ++y) {
        for (u32 x = 0; x < dstWidth; ++x) {
            // Map to top-left of the 2x2 block in source
            const u32 srcX = x * 2;
            const u32 srcY = y * 2;

            const RGBA8 &p00 = src.at(srcX, srcY);
            const RGBA8 &p10 = src.at(srcX + 1, srcY);
            const RGBA8 &p01 = src.at(srcX, srcY + 1);
            const RGBA8 &p11 = src.at(srcX + 1, srcY + 1);

            // +2 for rounding
            const u32 r = (p00.r + p10.r + p01.r + p11.r + 2) / 4;
            const u32 g = (p00.g + p10.g + p01.g + p11.g + 2) / 4;
            const u32 b = (p00.b + p10.b + p01.b + p11.b + 2) / 4;
            const u32 a = (p00.a + p10.a + p01.a + p11.a + 2) / 4;

            dst->at(x, y) = RGBA8(static_cast<u8>(r), static_cast<u8>(g),
                                  static_cast<u8>(b), static_cast<u8>(a));
        }
    }
}

void downscaleBox(const RasterImage &src, u32 factor, RasterImage *dst) {
    const u32 dstWidth = dst->width();
    const u32 dstHeight = dst->height();
    const u32 area = factor * factor;

    for (u32 y = 0; y < dstHeight; ++y) {
        for (u32 x = 0; x < dstWidth; ++x) {
            u32 r = 0, g = 0, b = 0, a = 0;
            for (u32 sy = y * factor; sy < (y + 1) * factor; ++sy) {
                for (u32 sx = x * factor; sx < (x + 1) * factor; ++sx) {
                    const RGBA8 &p = src.at(sx, sy);
                    r += p.r;
                    g += p.g;
                    b += p.b;
                    a += p.a;
                }
            }
            const u32 half = area / 2;
            dst->at(x, y) = RGBA8(static_cast<u8>((r + half) / area),
                                  static_cast<u8>((g + half) / area),
                                  static_cast<u8>((b + half) / area),
                                  static_cast<u8>((a + half) / area));
        }
    }
}

void downscaleArbitrary(const RasterImage &src, RasterImage *dst) {
    const u64 srcWidth = src.width();
    const u64 srcHeight = src.height();
    const u64 dstWidth = dst->width();
    const u64 dstHeight = dst->height();

    const u64 FP_ONE = 256; // Q8.8 fixed-point multiplier

    for (u64 dy = 0; dy < dstHeight; ++dy) {
        // Fractional boundaries in Q8.8
        const u64 dstY0 = (dy * srcHeight * FP_ONE) / dstHeight;
        const u64 dstY1 = ((dy + 1) * srcHeight * FP_ONE) / dstHeight;

        for (u64 dx = 0; dx < dstWidth; ++dx) {
            const u64 dstX0 = (dx * srcWidth * FP_ONE) / dstWidth;
            const u64 dstX1 = ((dx + 1) * srcWidth * FP_ONE) / dstWidth;

            u64 rSum = 0, gSum = 0, bSum = 0, aSum = 0;
            u64 totalWeight = 0;

            // Find covered source pixels
            const u64 srcY_start = dstY0 / FP_ONE;
            const u64 srcY_end = (dstY1 + FP_ONE - 1) / FP_ONE; // ceil
            const u64 srcX_start = dstX0 / FP_ONE;
            const u64 srcX_end = (dstX1 + FP_ONE - 1) / FP_ONE; // ceil

            for (u64 sy = srcY_start; sy < srcY_end; ++sy) {
                // Vertical overlap in Q8.8
                const u64 sy0 = sy * FP_ONE;
                const u64 sy1 = (sy + 1) * FP_ONE;
                const u64 y_overlap = HT_MIN(dstY1, sy1) - HT_MAX(dstY0, sy0);
                if (y_overlap == 0)
                    continue;

                for (u64 sx = srcX_start; sx < srcX_end; ++sx) {
                    const u64 sx0 = sx * FP_ONE;
                    const u64 sx1 = (sx + 1) * FP_ONE;
                    const u64 x_overlap =
                        HT_MIN(dstX1, sx1) - HT_MAX(dstX0, sx0);
                    if (x_overlap == 0)
                        continue;

                    // Q8.8 * Q8.8 -> Q16.16 -> Q8.8
                    const u64 weight =
                        (x_overlap * y_overlap + (FP_ONE >> 1)) >> 8;

                    const RGBA8 &p = src.at(static_cast<u32>(sx),
                                            static_cast<u32>(sy));
                    rSum += p.r * weight;
                    gSum += p.g * weight;
                    bSum += p.b * weight;
                    aSum += p.a * weight;
                    totalWeight += weight;
                }
            }

            const u64 half = totalWeight >> 1;
            const u8 r =
                static_cast<u8>(totalWeight ? (rSum + half) / totalWeight : 0);
            const u8 g =
                static_cast<u8>(totalWeight ? (gSum + half) / totalWeight : 0);
            const u8 b =
                static_cast<u8>(totalWeight ? (bSum + half) / totalWeight : 0);
            const u8 a =
                static_cast<u8>(totalWeight ? (aSum + half) / totalWeight : 0);

            dst->at(static_cast<u32>(dx), static_cast<u32>(dy)) =
                RGBA8(r, g, b, a);
        }
    }
}

bool downscale(const RasterImage &src, RasterImage *dst) {
    const u32 srcWidth = src.width();
    const u32 srcHeight = src.height();
    const u32 dstWidth = dst->width();
    const u32 dstHeight = dst->height();

    if (dstWidth == 0 || dstHeight == 0 || dstWidth > srcWidth ||
        dstHeight > srcHeight) {
        HT_WARN("downscale: cannot reduce " << srcWidth << "x" << srcHeight
                                            << " into " << dstWidth << "x"
                                            << dstHeight);
        return false;
    }

    const bool destination_is_half_of_source =
        (dstWidth * 2 == srcWidth) && (dstHeight * 2 == srcHeight);
    if (destination_is_half_of_source) {
        downscaleHalf(src, dst);
        return true;
    }

    const bool integer_factor = (srcWidth % dstWidth == 0) &&
                                (srcHeight % dstHeight == 0) &&
                                (srcWidth / dstWidth == srcHeight / dstHeight);
    if (integer_factor) {
        downscaleBox(src, srcWidth / dstWidth, dst);
        return true;
    }

    downscaleArbitrary(src, dst);
    return true;
}

} // namespace ht
