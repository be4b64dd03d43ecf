#include "ht/shadow_mask.h"

#include "ht/map_range.h"
#include "ht/raster_image.h"

namespace ht {

float shadowMaskValue(float luminance) {
    const float threshold = static_cast<float>(HALFTONE_SHADOW_THRESHOLD);
    if (luminance < threshold) {
        return map_range<float, float>(luminance, 0.0f, threshold, 0.0f,
                                       255.0f);
    }
    return 255.0f;
}

RasterImage deriveShadowMask(const RasterImage &source) {
    RasterImage mask(source.width(), source.height());
    const size count = static_cast<size>(source.width()) * source.height();
    const RGBA8 *in = source.data();
    RGBA8 *out = mask.data();
    for (size i = 0; i < count; ++i) {
        const float v = shadowMaskValue(in[i].luminance());
        const u8 gray = static_cast<u8>(clamp(v + 0.5f, 0.0f, 255.0f));
        out[i] = RGBA8(gray, gray, gray, 255);
    }
    return mask;
}

} // namespace ht
