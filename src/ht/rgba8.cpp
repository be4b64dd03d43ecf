#include "ht/rgba8.h"

#include <stdio.h>

namespace ht {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Reads text[pos], text[pos + 1] as one byte. Returns -1 on a bad digit.
int hexByte(const std::string &text, size pos) {
    int hi = hexDigit(text[pos]);
    int lo = hexDigit(text[pos + 1]);
    if (hi < 0 || lo < 0) {
        return -1;
    }
    return (hi << 4) | lo;
}

u8 mix(u8 under, u8 over, u8 amount) {
    // Rounded (under * (255 - amount) + over * amount) / 255
    u32 v = static_cast<u32>(under) * (255u - amount) +
            static_cast<u32>(over) * amount + 127u;
    return static_cast<u8>(v / 255u);
}

} // namespace

Result<RGBA8> RGBA8::fromHex(const std::string &text) {
    std::string digits = text;
    if (!digits.empty() && digits[0] == '#') {
        digits.erase(0, 1);
    }
    if (digits.size() == 3) {
        std::string expanded;
        for (size i = 0; i < 3; ++i) {
            expanded.push_back(digits[i]);
            expanded.push_back(digits[i]);
        }
        digits = expanded;
    }
    if (digits.size() != 6 && digits.size() != 8) {
        return Result<RGBA8>::failure(ResultError::INVALID_ARGUMENT,
                                      "color must be #RGB, #RRGGBB or "
                                      "#RRGGBBAA: '" + text + "'");
    }
    int channels[4] = {0, 0, 0, 255};
    for (size i = 0; i * 2 < digits.size(); ++i) {
        channels[i] = hexByte(digits, i * 2);
        if (channels[i] < 0) {
            return Result<RGBA8>::failure(ResultError::INVALID_ARGUMENT,
                                          "invalid hex digit in color '" +
                                              text + "'");
        }
    }
    return Result<RGBA8>::success(
        RGBA8(static_cast<u8>(channels[0]), static_cast<u8>(channels[1]),
              static_cast<u8>(channels[2]), static_cast<u8>(channels[3])));
}

RGBA8 RGBA8::blendOver(const RGBA8 &over, u8 amount) const {
    if (amount == 255) {
        return over;
    }
    if (amount == 0) {
        return *this;
    }
    RGBA8 out;
    out.r = mix(r, over.r, amount);
    out.g = mix(g, over.g, amount);
    out.b = mix(b, over.b, amount);
    // Alpha accumulates like paint: a + (1 - a) * coverage.
    u32 alpha = static_cast<u32>(a) +
                ((255u - a) * static_cast<u32>(amount) + 127u) / 255u;
    out.a = static_cast<u8>(alpha > 255u ? 255u : alpha);
    return out;
}

std::string RGBA8::toHex() const {
    char buf[10];
    if (a == 255) {
        snprintf(buf, sizeof(buf), "#%02X%02X%02X", r, g, b);
    } else {
        snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X", r, g, b, a);
    }
    return std::string(buf);
}

std::string RGBA8::toString() const {
    char buf[32];
    snprintf(buf, sizeof(buf), "RGBA8(%u,%u,%u,%u)", unsigned(r), unsigned(g),
             unsigned(b), unsigned(a));
    return std::string(buf);
}

std::ostream &operator<<(std::ostream &os, const RGBA8 &color) {
    return os << color.toString();
}

} // namespace ht
