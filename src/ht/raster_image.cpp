#include "ht/raster_image.h"

namespace ht {

RasterImage RasterImage::FromRGBA(u32 width, u32 height, const u8 *bytes) {
    RasterImage image(width, height);
    if (!bytes) {
        return image;
    }
    RGBA8 *out = image.data();
    const size count = static_cast<size>(width) * height;
    for (size i = 0; i < count; ++i) {
        const u8 *px = bytes + i * 4;
        out[i] = RGBA8(px[0], px[1], px[2], px[3]);
    }
    return image;
}

std::vector<u8> RasterImage::toRGBA() const {
    std::vector<u8> bytes;
    const size count = static_cast<size>(width()) * height();
    bytes.reserve(count * 4);
    const RGBA8 *in = data();
    for (size i = 0; i < count; ++i) {
        bytes.push_back(in[i].r);
        bytes.push_back(in[i].g);
        bytes.push_back(in[i].b);
        bytes.push_back(in[i].a);
    }
    return bytes;
}

} // namespace ht
