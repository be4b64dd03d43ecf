#pragma once

#include "ht/geometry.h"
#include "ht/int.h"

namespace ht {

// Axis-aligned box that encloses the canvas after rotating it about its
// center. Walking a grid over this box covers the whole canvas at any angle.
using GridBounds = rect<i32>;

inline float toRadians(float degrees) {
    return degrees * static_cast<float>(HT_PI / 180.0);
}

// Any real angle -> [0, 360).
float normalizeAngle(float degrees);

// Rotates `point` about `center` by `radians` (counter-clockwise in a y-up
// frame, clockwise on screen).
vec2f rotatePointAboutPosition(const vec2f &point, const vec2f &center,
                               float radians);

// Bounding box of the W x H canvas rotated by `degrees` about (W/2, H/2).
// Min corner is floored and max corner ceiled; 0 degrees gives exactly
// (0, 0, W, H).
GridBounds computeGridBounds(u32 width, u32 height, float degrees);

} // namespace ht
