module;

#include <cstdint>
#include <string>
#include <string_view>

export module Cloner:Color;

import Core.Error;

// =============================================================================
// Hex color parsing and per-instance color progression.
//
// Convention: colors cross the boundary as "#rrggbb" strings (the leading '#'
// is optional on input, hex digits are case-insensitive). Output is always
// lowercase "#rrggbb" built from rounded, clamped byte channels.
// =============================================================================

export namespace Cloner::Color
{
    enum class InterpolationMode : uint8_t
    {
        Linear, // R, G and B independently
        Hsv     // hue along the shorter arc, saturation and value linearly
    };

    struct Rgb
    {
        uint8_t R{0};
        uint8_t G{0};
        uint8_t B{0};

        bool operator==(const Rgb&) const = default;
    };

    // All channels in [0, 1]. Hue is a fraction of a full turn.
    struct Hsv
    {
        double H{0.0};
        double S{0.0};
        double V{0.0};
    };

    [[nodiscard]] Core::Expected<Rgb> ParseHex(std::string_view hex);
    [[nodiscard]] std::string ToHex(Rgb color);

    // Rounds and clamps a channel given on the 0..255 scale.
    [[nodiscard]] constexpr uint8_t ClampChannel(double v) noexcept
    {
        if (!(v > 0.0)) return 0;
        if (v >= 255.0) return 255;
        return static_cast<uint8_t>(v + 0.5);
    }

    [[nodiscard]] Hsv RgbToHsv(Rgb color);
    [[nodiscard]] Rgb HsvToRgb(const Hsv& color);

    [[nodiscard]] Core::Expected<InterpolationMode> ParseInterpolationMode(std::string_view name);

    // Per-channel (Linear) or shortest-hue-arc (Hsv) blend at progress t.
    [[nodiscard]] Rgb Interpolate(Rgb start, Rgb end, double t, InterpolationMode mode);

    // Interpolates between two hex colors at progress t. If either endpoint
    // fails to parse, the start color is returned unchanged.
    [[nodiscard]] std::string Interpolate(std::string_view startHex, std::string_view endHex, double t,
        InterpolationMode mode);
}
