#include "test.h"

#include "ht/shadow_mask.h"

TEST_CASE("shadowMaskValue") {
    CHECK(shadowMaskValue(200.0f) == 255.0f);
    CHECK(shadowMaskValue(127.0f) == 255.0f);
    CHECK(shadowMaskValue(0.0f) == 0.0f);
    CHECK_CLOSE(shadowMaskValue(50.0f), 50.0f * 255.0f / 127.0f, 0.01f);
    CHECK_CLOSE(shadowMaskValue(126.0f), 252.99f, 0.01f);
}

TEST_CASE("deriveShadowMask") {
    RasterImage source(3, 1);
    source.at(0, 0) = RGBA8(50, 50, 50, 255);
    source.at(1, 0) = RGBA8(200, 200, 200, 255);
    source.at(2, 0) = RGBA8(0, 0, 0, 0);

    RasterImage mask = deriveShadowMask(source);
    REQUIRE(mask.width() == 3);
    REQUIRE(mask.height() == 1);

    // 50 * 255 / 127 = 100.4
    CHECK(mask.at(0, 0) == RGBA8(100, 100, 100, 255));
    CHECK(mask.at(1, 0) == RGBA8::White());
    // Alpha is forced opaque.
    CHECK(mask.at(2, 0) == RGBA8::Black());
}

TEST_CASE("deriveShadowMask of an empty image") {
    RasterImage mask = deriveShadowMask(RasterImage());
    CHECK(mask.empty());
}
