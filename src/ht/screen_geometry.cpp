#include "ht/screen_geometry.h"

#include <math.h>

namespace ht {

float normalizeAngle(float degrees) {
    float out = fmodf(degrees, 360.0f);
    if (out < 0.0f) {
        out += 360.0f;
    }
    // fmodf(-1e-8, 360) + 360 rounds to 360 in float.
    if (out >= 360.0f) {
        out = 0.0f;
    }
    return out;
}

vec2f rotatePointAboutPosition(const vec2f &point, const vec2f &center,
                               float radians) {
    const float c = cosf(radians);
    const float s = sinf(radians);
    const float dx = point.x - center.x;
    const float dy = point.y - center.y;
    return vec2f(dx * c - dy * s + center.x, dx * s + dy * c + center.y);
}

GridBounds computeGridBounds(u32 width, u32 height, float degrees) {
    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    const float radians = toRadians(normalizeAngle(degrees));
    const vec2f center(w / 2.0f, h / 2.0f);

    const vec2f corners[4] = {vec2f(0.0f, 0.0f), vec2f(w, 0.0f), vec2f(w, h),
                              vec2f(0.0f, h)};

    vec2f first = rotatePointAboutPosition(corners[0], center, radians);
    rect<float> box(first, first);
    for (int i = 1; i < 4; ++i) {
        box.expand(rotatePointAboutPosition(corners[i], center, radians));
    }

    return GridBounds(static_cast<i32>(floorf(box.mMin.x)),
                      static_cast<i32>(floorf(box.mMin.y)),
                      static_cast<i32>(ceilf(box.mMax.x)),
                      static_cast<i32>(ceilf(box.mMax.y)));
}

} // namespace ht
