#include "ht/halftone_settings.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include <sstream>

#include "ht/screen_config.h"
#include "ht/supersample.h"
#include "ht/warn.h"

namespace ht {

namespace {

typedef Result<void, HalftoneError> SettingResult;

SettingResult badValue(const std::string &key, const std::string &value,
                       const char *expected) {
    return SettingResult::failure(HalftoneError::INVALID_PARAMETER,
                                  "option " + key + ": expected " + expected +
                                      ", got '" + value + "'");
}

std::string trim(const std::string &text) {
    const char *ws = " \t\r\n";
    const size begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    const size end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

bool parseFloat(const std::string &text, float *out) {
    const std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    const float v = std::strtof(t.c_str(), &end);
    if (errno != 0 || end != t.c_str() + t.size() || !std::isfinite(v)) {
        return false;
    }
    *out = v;
    return true;
}

bool parseInt(const std::string &text, i32 *out) {
    const std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    const long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size() || v < -2147483647L ||
        v > 2147483647L) {
        return false;
    }
    *out = static_cast<i32>(v);
    return true;
}

bool parseBool(const std::string &text, bool *out) {
    std::string t = trim(text);
    for (size i = 0; i < t.size(); ++i) {
        if (t[i] >= 'A' && t[i] <= 'Z') {
            t[i] = static_cast<char>(t[i] - 'A' + 'a');
        }
    }
    if (t == "true" || t == "1" || t == "yes" || t == "on") {
        *out = true;
        return true;
    }
    if (t == "false" || t == "0" || t == "no" || t == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool parseColorList(const std::string &text, std::vector<RGBA8> *out) {
    std::vector<RGBA8> colors;
    size start = 0;
    while (start <= text.size()) {
        size comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        Result<RGBA8> color =
            RGBA8::fromHex(trim(text.substr(start, comma - start)));
        if (!color.ok()) {
            return false;
        }
        colors.push_back(color.value().opaque());
        start = comma + 1;
    }
    *out = colors;
    return true;
}

} // namespace

const char *toString(OutputScale scale) {
    switch (scale) {
    case OutputScale::kSupersampled:
        return "supersampled";
    case OutputScale::kNominal:
        return "nominal";
    }
    return "unknown";
}

HalftoneSettings HalftoneSettings::Defaults(HalftoneMode mode) {
    HalftoneSettings settings;
    settings.mode = mode;
    settings.colors = recipeFor(mode).defaultColors();
    return settings;
}

SettingResult HalftoneSettings::setOption(const std::string &key,
                                          const std::string &value) {
    if (key == "mode") {
        Result<HalftoneMode> parsed = parseMode(trim(value));
        if (!parsed.ok()) {
            return badValue(key, value, "basic, duotone or tritone");
        }
        mode = parsed.value();
        if (!mColorsFromOptions) {
            colors = recipeFor(mode).defaultColors();
        }
    } else if (key == "anchor") {
        Result<AnchorStrategy> parsed = parseAnchorStrategy(trim(value));
        if (!parsed.ok()) {
            return badValue(key, value, "traditional or legacy");
        }
        anchor = parsed.value();
    } else if (key == "traditional") {
        bool traditional = true;
        if (!parseBool(value, &traditional)) {
            return badValue(key, value, "a boolean");
        }
        anchor = traditional ? AnchorStrategy::kTraditional
                             : AnchorStrategy::kLegacy;
    } else if (key == "dot_size") {
        float v = 0.0f;
        if (!parseFloat(value, &v)) {
            return badValue(key, value, "a number");
        }
        dot_size = v;
    } else if (key == "dot_resolution" || key == "dot_spacing") {
        i32 v = 0;
        if (!parseInt(value, &v)) {
            return badValue(key, value, "an integer");
        }
        dot_resolution = v;
    } else if (key == "screen_angle" || key == "angle") {
        float v = 0.0f;
        if (!parseFloat(value, &v)) {
            return badValue(key, value, "a number");
        }
        screen_angle = v;
    } else if (key == "invert") {
        bool v = false;
        if (!parseBool(value, &v)) {
            return badValue(key, value, "a boolean");
        }
        invert = v;
    } else if (key == "color") {
        Result<RGBA8> parsed = RGBA8::fromHex(trim(value));
        if (!parsed.ok()) {
            return badValue(key, value, "a hex color");
        }
        if (!mColorsFromOptions) {
            colors.clear();
            mColorsFromOptions = true;
        }
        colors.push_back(parsed.value().opaque());
    } else if (key == "colors") {
        std::vector<RGBA8> parsed;
        if (!parseColorList(value, &parsed)) {
            return badValue(key, value, "comma separated hex colors");
        }
        colors = parsed;
        mColorsFromOptions = true;
    } else if (key == "background") {
        Result<RGBA8> parsed = RGBA8::fromHex(trim(value));
        if (!parsed.ok()) {
            return badValue(key, value, "a hex color");
        }
        background = parsed.value();
    } else if (key == "supersample") {
        i32 v = 0;
        if (!parseInt(value, &v) || !isSupportedSuperSample(v)) {
            return badValue(key, value, "1, 2 or 4");
        }
        supersample = v;
    } else if (key == "output_scale") {
        const std::string t = trim(value);
        if (t == "supersampled") {
            output_scale = OutputScale::kSupersampled;
        } else if (t == "nominal") {
            output_scale = OutputScale::kNominal;
        } else {
            return badValue(key, value, "supersampled or nominal");
        }
    } else if (key == "threshold") {
        // Accepted from older clients; the dot radius follows luminance
        // directly.
    } else {
        return SettingResult::failure(HalftoneError::INVALID_PARAMETER,
                                      "unknown option '" + key + "'");
    }
    return SettingResult::success();
}

SettingResult HalftoneSettings::validate() const {
    if (!isKnownMode(mode)) {
        std::ostringstream msg;
        msg << "unknown halftone mode " << static_cast<int>(mode);
        return SettingResult::failure(HalftoneError::INVALID_PARAMETER,
                                      msg.str());
    }
    ScreenConfig screen;
    screen.angle = screen_angle;
    screen.dot_size = dot_size;
    screen.dot_resolution = dot_resolution;
    screen.invert = invert;
    screen.anchor = anchor;
    SettingResult checked = screen.validate("settings");
    if (!checked.ok()) {
        return checked;
    }
    const Recipe &recipe = recipeFor(mode);
    if (colors.size() != recipe.colorCount()) {
        std::ostringstream msg;
        msg << "settings: " << recipe.name << " needs " << recipe.colorCount()
            << " color(s), got " << colors.size();
        return SettingResult::failure(HalftoneError::INVALID_PARAMETER,
                                      msg.str());
    }
    if (!isSupportedSuperSample(supersample)) {
        std::ostringstream msg;
        msg << "settings: unsupported supersample factor " << supersample;
        return SettingResult::failure(HalftoneError::INVALID_PARAMETER,
                                      msg.str());
    }
    HT_WARN_IF(dot_size > HALFTONE_MAX_RECOMMENDED_DOT_SIZE,
               "dot_size " << dot_size << " is above the recommended "
                           << HALFTONE_MAX_RECOMMENDED_DOT_SIZE);
    return SettingResult::success();
}

std::string HalftoneSettings::toString() const {
    std::ostringstream out;
    out << "HalftoneSettings(mode=" << ht::toString(mode)
        << ", anchor=" << ht::toString(anchor) << ", dot_size=" << dot_size
        << ", dot_resolution=" << dot_resolution
        << ", screen_angle=" << screen_angle
        << ", invert=" << (invert ? "true" : "false") << ", colors=[";
    for (size i = 0; i < colors.size(); ++i) {
        out << (i ? "," : "") << colors[i].toHex();
    }
    out << "], background=" << background.toHex()
        << ", supersample=" << supersample
        << ", output_scale=" << ht::toString(output_scale) << ")";
    return out.str();
}

} // namespace ht
