#include "test.h"

#include <string>
#include <vector>

#include "ht/dbg.h"
#include "ht/error.h"
#include "ht/halftone_engine.h"
#include "ht/io.h"
#include "ht/warn.h"

namespace {

struct CapturedLines {
    CapturedLines() {
        inject_println_handler(
            [this](const char *line) { lines.push_back(line); });
    }
    ~CapturedLines() { clear_io_handlers(); }

    bool contains(const std::string &needle) const {
        for (size i = 0; i < lines.size(); ++i) {
            if (lines[i].find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> lines;
};

} // namespace

TEST_CASE("log macros go through println") {
    CapturedLines captured;
    HT_WARN("dot_size " << 42);
    HT_ERROR("broken " << 1.5f);
    HT_WARN_IF(false, "never");

    REQUIRE(captured.lines.size() == 2);
    CHECK(captured.lines[0] == "WARN: dot_size 42");
    CHECK(captured.lines[1] == "ERROR: broken 1.5");
}

TEST_CASE("conditional log macros") {
    CapturedLines captured;
    HT_ERROR_IF(false, "hidden");
    HT_ERROR_IF(true, "shown " << 3);
    HT_DBG_IF(false, "hidden");
    HT_DBG_IF(true, "debug " << 4);

    REQUIRE(captured.lines.size() == 2);
    CHECK(captured.lines[0] == "ERROR: shown 3");
    CHECK(captured.lines[1].find("debug 4") != std::string::npos);
}

TEST_CASE("print handler") {
    std::string printed;
    inject_print_handler([&printed](const char *text) { printed += text; });
    print("a");
    print("b");
    print(nullptr);
    clear_io_handlers();
    CHECK(printed == "ab");
}

TEST_CASE("HT_DBG prefixes the source location") {
    CapturedLines captured;
    HT_DBG("value " << 7);
    REQUIRE(captured.lines.size() == 1);
    CHECK(captured.lines[0].find("test_log.cpp(") != std::string::npos);
    CHECK(captured.lines[0].find("value 7") != std::string::npos);
}

TEST_CASE("halftone_file_offset") {
    CHECK(std::string(halftone_file_offset("/a/b/src/ht/dbg.h")) ==
          "src/ht/dbg.h");
    CHECK(std::string(halftone_file_offset("blah/blah/blah.h")) == "blah.h");
    CHECK(std::string(halftone_file_offset("plain.h")) == "plain.h");
}

TEST_CASE("conversion failures are logged") {
    CapturedLines captured;
    HalftoneResult<HalftoneOutput> out =
        HalftoneEngine().convert(nullptr, HalftoneSettings::Defaults());
    CHECK(out.error() == HalftoneError::SOURCE_IMAGE_MISSING);
    CHECK(captured.contains("WARN: halftone: no source image"));
}

TEST_CASE("oversized dots are logged but still render") {
    CapturedLines captured;
    RasterImage source = makeGray(10, 10, 0);
    HalftoneSettings settings = HalftoneSettings::Defaults();
    settings.dot_size = 64.0f;
    HalftoneResult<HalftoneOutput> out =
        HalftoneEngine().convert(&source, settings);
    CHECK(out.ok());
    CHECK(captured.contains("above the recommended"));
}

TEST_CASE("HalftoneError names") {
    CHECK(std::string(toString(HalftoneError::INVALID_PARAMETER)) ==
          "INVALID_PARAMETER");
    CHECK(std::string(toString(HalftoneError::CANCELLED)) == "CANCELLED");
}
