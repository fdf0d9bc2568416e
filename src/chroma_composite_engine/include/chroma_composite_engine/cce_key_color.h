#pragma once

#include "cce_errors.h"
#include <optional>
#include <string>

namespace cce {

// HSV triplet in OpenCV 8-bit convention: H 0..179, S 0..255, V 0..255
struct HsvTriplet {
    int h;
    int s;
    int v;

    bool operator==(const HsvTriplet& other) const {
        return h == other.h && s == other.s && v == other.v;
    }
};

constexpr int HUE_MAX = 179;
constexpr int SV_MAX = 255;

enum class KeyPreset {
    Green,
    Blue,
    Custom
};

const char* key_preset_to_string(KeyPreset preset);
std::optional<KeyPreset> key_preset_from_string(const std::string& name);

// Backdrop color bounds.
// A hue lower bound greater than the upper bound describes a range that
// wraps the hue origin (red keys): [lower.h, 179] U [0, upper.h].
struct KeyColorSpec {
    KeyPreset preset = KeyPreset::Green;
    HsvTriplet lower{35, 40, 40};
    HsvTriplet upper{85, 255, 255};

    static KeyColorSpec Green();
    static KeyColorSpec Blue();
    static KeyColorSpec Custom(HsvTriplet lower, HsvTriplet upper);

    bool hue_wraps() const { return lower.h > upper.h; }

    // Hue at the middle of the range, wrap-aware (0..179)
    int hue_center() const;

    // Returns InvalidParameter naming "<field_prefix>.lower" or
    // "<field_prefix>.upper" when a bound is out of domain or the
    // interval is empty.
    Result<void> validate(const std::string& field_prefix = "key_color") const;
};

} // namespace cce
