#pragma once

namespace ht {
enum SuperSample {
    SUPER_SAMPLE_NONE = 1, // 1x supersampling (no supersampling)
    SUPER_SAMPLE_2X = 2,   // 2x supersampling
    SUPER_SAMPLE_4X = 4,   // 4x supersampling
};

inline bool isSupportedSuperSample(int factor) {
    return factor == SUPER_SAMPLE_NONE || factor == SUPER_SAMPLE_2X ||
           factor == SUPER_SAMPLE_4X;
}
} // namespace ht
