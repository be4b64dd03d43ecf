#include "test.h"

#include "ht/halftone_engine.h"
#include "ht/shadow_mask.h"

namespace {

HalftoneResult<HalftoneOutput> run(const RasterImage &source,
                                   const HalftoneSettings &settings) {
    return HalftoneEngine().convert(&source, settings);
}

} // namespace

TEST_CASE("dot radius follows luminance at any screen angle") {
    // Uniform luminance 127 -> radius 5 * (1 - 127/255) = 2.51.
    RasterImage source = makeGray(100, 100, 127);
    const float angles[] = {0.0f, 45.0f, 90.0f};
    for (float angle : angles) {
        INFO("angle " << angle);
        HalftoneSettings settings = HalftoneSettings::Defaults();
        settings.dot_resolution = 8;
        settings.dot_size = 10.0f;
        settings.screen_angle = angle;

        HalftoneResult<HalftoneOutput> out = run(source, settings);
        REQUIRE(out.ok());
        const LayerStats &layer = out.value().stats.layers[0];
        CHECK(layer.dots_drawn > 0);
        CHECK_CLOSE(layer.min_radius, 2.5f, 0.5f);
        CHECK_CLOSE(layer.max_radius, 2.5f, 0.5f);
    }
}

TEST_CASE("conversion is deterministic") {
    RasterImage source(64, 48);
    for (u32 y = 0; y < 48; ++y) {
        for (u32 x = 0; x < 64; ++x) {
            source.at(x, y) = RGBA8(static_cast<u8>(x * 4),
                                    static_cast<u8>(y * 5), 90, 255);
        }
    }
    HalftoneSettings settings =
        HalftoneSettings::Defaults(HalftoneMode::kTritone);
    settings.screen_angle = 22.5f;

    HalftoneResult<HalftoneOutput> first = run(source, settings);
    HalftoneResult<HalftoneOutput> second = run(source, settings);
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    CHECK(first.value().image == second.value().image);
    CHECK(first.value().stats.dotsDrawn() == second.value().stats.dotsDrawn());
}

TEST_CASE("black source in basic mode dots every grid cell") {
    RasterImage source = makeGray(400, 300, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    settings.dot_size = 10.0f;
    settings.dot_resolution = 5;

    HalftoneResult<HalftoneOutput> out = run(source, settings);
    REQUIRE(out.ok());
    const HalftoneOutput &output = out.value();
    CHECK(output.scale == 2);
    REQUIRE(output.image.width() == 800);
    REQUIRE(output.image.height() == 600);

    REQUIRE(output.stats.layers.size() == 1);
    const LayerStats &layer = output.stats.layers[0];
    CHECK(layer.cells_visited == 4800);
    CHECK(layer.dots_drawn == 4800);
    CHECK(layer.rejected() == 0);
    CHECK(layer.min_radius == 5.0f);
    CHECK(layer.max_radius == 5.0f);

    u32 black_centers = 0;
    for (u32 gy = 0; gy < 300; gy += 5) {
        for (u32 gx = 0; gx < 400; gx += 5) {
            if (output.image.at(gx * 2, gy * 2) == RGBA8::Black()) {
                ++black_centers;
            }
        }
    }
    CHECK(black_centers == 4800);
}

TEST_CASE("white source in basic mode draws nothing") {
    RasterImage source = makeGray(40, 30, 255);
    HalftoneResult<HalftoneOutput> out =
        run(source, HalftoneSettings::Defaults());
    REQUIRE(out.ok());
    CHECK(out.value().stats.dotsDrawn() == 0);
    CHECK(countPixels(out.value().image, RGBA8::White()) == 80 * 60);
}

TEST_CASE("invert swaps dark and light") {
    RasterImage source = makeGray(40, 30, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    settings.invert = true;
    HalftoneResult<HalftoneOutput> out = run(source, settings);
    REQUIRE(out.ok());
    CHECK(out.value().stats.dotsDrawn() == 0);
    CHECK(countPixels(out.value().image, RGBA8::White()) == 80 * 60);
}

TEST_CASE("background and color settings reach the canvas") {
    RasterImage source = makeGray(20, 20, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    REQUIRE(settings.setOption("color", "#0000FF").ok());
    REQUIRE(settings.setOption("background", "#00FF00").ok());
    settings.dot_size = 2.0f;
    settings.dot_resolution = 10;

    HalftoneResult<HalftoneOutput> out = run(source, settings);
    REQUIRE(out.ok());
    const RasterImage &image = out.value().image;
    CHECK(image.at(20, 20) == RGBA8(0, 0, 255));
    CHECK(image.at(10, 10) == RGBA8(0, 255, 0));
}

TEST_CASE("nominal output scale") {
    RasterImage source = makeGray(40, 30, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    settings.dot_size = 10.0f;
    settings.output_scale = OutputScale::kNominal;

    HalftoneResult<HalftoneOutput> out = run(source, settings);
    REQUIRE(out.ok());
    CHECK(out.value().scale == 1);
    CHECK(out.value().image.width() == 40);
    CHECK(out.value().image.height() == 30);
    // Radius 5 dots every 5 units leave no gaps between grid points. Past
    // the last row and column the dots only partly reach the edge.
    const RasterImage &image = out.value().image;
    u32 black = 0;
    for (u32 y = 0; y < 26; ++y) {
        for (u32 x = 0; x < 36; ++x) {
            if (image.at(x, y) == RGBA8::Black()) {
                ++black;
            }
        }
    }
    CHECK(black == 36 * 26);
}

TEST_CASE("supersample factor sets the canvas size") {
    RasterImage source = makeGray(16, 8, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();

    settings.supersample = 1;
    HalftoneResult<HalftoneOutput> one = run(source, settings);
    REQUIRE(one.ok());
    CHECK(one.value().image.width() == 16);
    CHECK(one.value().scale == 1);

    settings.supersample = 4;
    HalftoneResult<HalftoneOutput> four = run(source, settings);
    REQUIRE(four.ok());
    CHECK(four.value().image.width() == 64);
    CHECK(four.value().image.height() == 32);
    CHECK(four.value().scale == 4);
}

TEST_CASE("duotone") {
    SUBCASE("two layers, the second sampling the shadow mask") {
        RasterImage source = makeGray(30, 30, 0);
        HalftoneResult<HalftoneOutput> out =
            run(source, HalftoneSettings::Defaults(HalftoneMode::kDuotone));
        REQUIRE(out.ok());
        REQUIRE(out.value().stats.layers.size() == 2);
        CHECK(out.value().stats.layers[0].dots_drawn > 0);
        CHECK(out.value().stats.layers[1].dots_drawn == 36);
        // The shadow layer is drawn last at +0 degrees.
        CHECK(out.value().image.at(10, 10) == RGBA8::Black());
    }

    SUBCASE("midtones are left to the highlight layer") {
        RasterImage source = makeGray(30, 30, 200);
        HalftoneResult<HalftoneOutput> out =
            run(source, HalftoneSettings::Defaults(HalftoneMode::kDuotone));
        REQUIRE(out.ok());
        CHECK(out.value().stats.layers[0].dots_drawn > 0);
        CHECK(out.value().stats.layers[1].dots_drawn == 0);
        CHECK(countPixels(out.value().image, RGBA8::Black()) == 0);
    }
}

TEST_CASE("tritone renders three layers") {
    RasterImage source = makeGray(30, 30, 60);
    HalftoneResult<HalftoneOutput> out =
        run(source, HalftoneSettings::Defaults(HalftoneMode::kTritone));
    REQUIRE(out.ok());
    REQUIRE(out.value().stats.layers.size() == 3);
    for (size i = 0; i < 3; ++i) {
        CHECK(out.value().stats.layers[i].dots_drawn > 0);
    }
}

TEST_CASE("buildJob expands recipes") {
    SUBCASE("layer angles are offset and normalized") {
        HalftoneSettings settings =
            HalftoneSettings::Defaults(HalftoneMode::kTritone);
        settings.screen_angle = 350.0f;
        HalftoneResult<HalftoneJob> job =
            HalftoneEngine::buildJob(settings, nullptr);
        REQUIRE(job.ok());
        REQUIRE(job.value().layers.size() == 3);
        CHECK_CLOSE(job.value().layers[0].screen.angle, 350.0f, 0.001f);
        CHECK_CLOSE(job.value().layers[1].screen.angle, 20.0f, 0.001f);
        CHECK_CLOSE(job.value().layers[2].screen.angle, 50.0f, 0.001f);
        CHECK(job.value().layers[0].clears_background);
        CHECK_FALSE(job.value().layers[2].clears_background);
        CHECK(job.value().layers[1].screen.color == RGBA8::fromCode(0xFF6347));
    }

    SUBCASE("duotone shadow layer points at the mask") {
        RasterImage mask = makeGray(4, 4, 255);
        HalftoneSettings settings =
            HalftoneSettings::Defaults(HalftoneMode::kDuotone);
        HalftoneResult<HalftoneJob> job =
            HalftoneEngine::buildJob(settings, &mask);
        REQUIRE(job.ok());
        CHECK(job.value().layers[0].derived_source == nullptr);
        CHECK(job.value().layers[1].derived_source == &mask);
        CHECK_CLOSE(job.value().layers[0].screen.angle, 15.0f, 0.001f);

        CHECK(HalftoneEngine::buildJob(settings, nullptr).error() ==
              HalftoneError::INVALID_PARAMETER);
    }
}

TEST_CASE("conversion errors") {
    RasterImage source = makeGray(20, 20, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();

    SUBCASE("missing source") {
        HalftoneResult<HalftoneOutput> out =
            HalftoneEngine().convert(nullptr, settings);
        CHECK(out.error() == HalftoneError::SOURCE_IMAGE_MISSING);
    }

    SUBCASE("empty source") {
        RasterImage empty;
        HalftoneResult<HalftoneOutput> out =
            HalftoneEngine().convert(&empty, settings);
        CHECK(out.error() == HalftoneError::SOURCE_IMAGE_MISSING);
    }

    SUBCASE("dot resolution of zero") {
        settings.dot_resolution = 0;
        CHECK(run(source, settings).error() ==
              HalftoneError::INVALID_PARAMETER);
    }

    SUBCASE("negative dot size") {
        settings.dot_size = -2.0f;
        CHECK(run(source, settings).error() ==
              HalftoneError::INVALID_PARAMETER);
    }

    SUBCASE("color count does not match the recipe") {
        settings = HalftoneSettings::Defaults(HalftoneMode::kDuotone);
        settings.colors.pop_back();
        HalftoneResult<HalftoneOutput> out = run(source, settings);
        CHECK(out.error() == HalftoneError::INVALID_PARAMETER);
        CHECK(std::string(out.message()).find("duotone") !=
              std::string::npos);
    }

    SUBCASE("unsupported supersample") {
        settings.supersample = 3;
        CHECK(run(source, settings).error() ==
              HalftoneError::INVALID_PARAMETER);
    }
}

TEST_CASE("cancellation") {
    RasterImage source = makeGray(60, 60, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();

    SUBCASE("callback") {
        ConvertOptions options;
        int polls = 0;
        options.should_cancel = [&polls]() { return ++polls > 2; };
        HalftoneResult<HalftoneOutput> out =
            HalftoneEngine().convert(&source, settings, options);
        CHECK(out.error() == HalftoneError::CANCELLED);
        CHECK(polls == 3);
    }

    SUBCASE("callback that never fires") {
        ConvertOptions options;
        int polls = 0;
        options.should_cancel = [&polls]() -> bool {
            ++polls;
            return false;
        };
        HalftoneResult<HalftoneOutput> out =
            HalftoneEngine().convert(&source, settings, options);
        CHECK(out.ok());
        // One poll per grid row.
        CHECK(polls == 12);
    }

    SUBCASE("generous time budget") {
        ConvertOptions options;
        options.timeout_ms = 60000;
        CHECK(HalftoneEngine().convert(&source, settings, options).ok());
    }
}

TEST_CASE("transparent pixels are skipped, not errors") {
    RasterImage source = makeGray(20, 20, 0);
    for (u32 y = 0; y < 10; ++y) {
        for (u32 x = 0; x < 20; ++x) {
            source.at(x, y) = RGBA8::Transparent();
        }
    }
    HalftoneResult<HalftoneOutput> out =
        run(source, HalftoneSettings::Defaults());
    REQUIRE(out.ok());
    const LayerStats &layer = out.value().stats.layers[0];
    CHECK(layer.rejected_transparent == 8);
    CHECK(layer.dots_drawn == 8);
    CHECK(out.value().stats.samplesRejected() == 8);
}

TEST_CASE("oversized dots cover the whole canvas") {
    RasterImage source = makeGray(20, 20, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    settings.dot_size = 1e10f;

    HalftoneResult<HalftoneOutput> out = run(source, settings);
    REQUIRE(out.ok());
    CHECK(out.value().stats.dotsDrawn() > 0);
    CHECK(countPixels(out.value().image, RGBA8::Black()) == 40 * 40);
}

TEST_CASE("a grid step near the i32 limit visits each cell once") {
    RasterImage source = makeGray(100, 10, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    REQUIRE(settings.setOption("dot_resolution", "2147483647").ok());
    settings.screen_angle = 90.0f;

    HalftoneResult<HalftoneOutput> out = run(source, settings);
    REQUIRE(out.ok());
    CHECK(out.value().stats.cellsVisited() == 1);
}
