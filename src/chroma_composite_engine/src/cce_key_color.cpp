#include <chroma_composite_engine/cce_key_color.h>
#include <cstdlib>

namespace cce {

const char* key_preset_to_string(KeyPreset preset) {
    switch (preset) {
        case KeyPreset::Green:  return "green";
        case KeyPreset::Blue:   return "blue";
        case KeyPreset::Custom: return "custom";
    }
    return "custom";
}

std::optional<KeyPreset> key_preset_from_string(const std::string& name) {
    if (name == "green") return KeyPreset::Green;
    if (name == "blue") return KeyPreset::Blue;
    if (name == "custom") return KeyPreset::Custom;
    return std::nullopt;
}

KeyColorSpec KeyColorSpec::Green() {
    return KeyColorSpec{KeyPreset::Green, {35, 40, 40}, {85, 255, 255}};
}

KeyColorSpec KeyColorSpec::Blue() {
    return KeyColorSpec{KeyPreset::Blue, {100, 40, 40}, {130, 255, 255}};
}

KeyColorSpec KeyColorSpec::Custom(HsvTriplet lower, HsvTriplet upper) {
    return KeyColorSpec{KeyPreset::Custom, lower, upper};
}

int KeyColorSpec::hue_center() const {
    if (!hue_wraps()) {
        return (lower.h + upper.h) / 2;
    }
    int span = (HUE_MAX + 1 - lower.h) + upper.h;
    return (lower.h + span / 2) % (HUE_MAX + 1);
}

static bool triplet_in_domain(const HsvTriplet& t) {
    return t.h >= 0 && t.h <= HUE_MAX &&
           t.s >= 0 && t.s <= SV_MAX &&
           t.v >= 0 && t.v <= SV_MAX;
}

Result<void> KeyColorSpec::validate(const std::string& field_prefix) const {
    if (!triplet_in_domain(lower)) {
        return Error::invalid_parameter(field_prefix + ".lower",
                                        "expected H 0..179, S 0..255, V 0..255");
    }
    if (!triplet_in_domain(upper)) {
        return Error::invalid_parameter(field_prefix + ".upper",
                                        "expected H 0..179, S 0..255, V 0..255");
    }
    // Hue may wrap; saturation and value may not
    if (lower.s > upper.s) {
        return Error::invalid_parameter(field_prefix + ".lower",
                                        "saturation lower bound exceeds upper bound");
    }
    if (lower.v > upper.v) {
        return Error::invalid_parameter(field_prefix + ".lower",
                                        "value lower bound exceeds upper bound");
    }
    return Result<void>();
}

} // namespace cce
