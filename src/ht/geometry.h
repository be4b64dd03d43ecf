#pragma once

#include <math.h>

#include "ht/int.h"
#include "ht/math_macros.h"

namespace ht {

template <typename T> struct vec2 {
    // value_type
    using value_type = T;
    value_type x = 0;
    value_type y = 0;
    constexpr vec2() = default;
    constexpr vec2(T x, T y) : x(x), y(y) {}

    template <typename U> explicit constexpr vec2(U xy) : x(xy), y(xy) {}

    constexpr vec2(const vec2 &p) = default;
    vec2 &operator=(const vec2 &p) = default;

    vec2 &operator*=(const float &f) {
        x *= f;
        y *= f;
        return *this;
    }

    vec2 &operator/=(const float &f) {
        x /= f;
        y /= f;
        return *this;
    }

    vec2 &operator+=(const vec2 &p) {
        x += p.x;
        y += p.y;
        return *this;
    }

    vec2 &operator-=(const vec2 &p) {
        x -= p.x;
        y -= p.y;
        return *this;
    }

    vec2 operator-(const vec2 &p) const { return vec2(x - p.x, y - p.y); }

    vec2 operator+(const vec2 &p) const { return vec2(x + p.x, y + p.y); }

    template <typename NumberT> vec2 operator*(const NumberT &p) const {
        return vec2(x * p, y * p);
    }

    template <typename NumberT> vec2 operator/(const NumberT &p) const {
        T a = x / p;
        T b = y / p;
        return vec2<T>(a, b);
    }

    bool operator==(const vec2 &p) const { return (x == p.x && y == p.y); }

    bool operator!=(const vec2 &p) const { return (x != p.x || y != p.y); }

    T distance(const vec2 &p) const {
        T dx = x - p.x;
        T dy = y - p.y;
        return sqrt(dx * dx + dy * dy);
    }
};

using vec2f = vec2<float>;
using vec2i32 = vec2<i32>;

template <typename T> struct rect {
    vec2<T> mMin;
    vec2<T> mMax;

    rect() = default;
    rect(const vec2<T> &min, const vec2<T> &max) : mMin(min), mMax(max) {}

    rect(T min_x, T min_y, T max_x, T max_y)
        : mMin(min_x, min_y), mMax(max_x, max_y) {}

    T width() const { return mMax.x - mMin.x; }

    T height() const { return mMax.y - mMin.y; }

    bool empty() const { return (mMin.x == mMax.x || mMin.y == mMax.y); }

    void expand(const vec2<T> &p) { expand(p.x, p.y); }

    void expand(T x, T y) {
        mMin.x = HT_MIN(mMin.x, x);
        mMin.y = HT_MIN(mMin.y, y);
        mMax.x = HT_MAX(mMax.x, x);
        mMax.y = HT_MAX(mMax.y, y);
    }

    /// bounds => [min, max) (max is exclusive)
    bool contains(const vec2<T> &p) const {
        return (p.x >= mMin.x && p.x < mMax.x && p.y >= mMin.y && p.y < mMax.y);
    }

    bool contains(const T &x, const T &y) const {
        return contains(vec2<T>(x, y));
    }

    bool operator==(const rect &r) const {
        return (mMin == r.mMin && mMax == r.mMax);
    }

    bool operator!=(const rect &r) const { return !(*this == r); }
};

} // namespace ht
