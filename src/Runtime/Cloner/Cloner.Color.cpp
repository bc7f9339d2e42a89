module;

#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <regex>
#include <string>
#include <string_view>
#include <algorithm>

module Cloner:Color.Impl;

import :Color;
import Core.Error;

namespace Cloner::Color
{
    static uint8_t ParseByte(std::string_view digits)
    {
        unsigned value = 0;
        std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
        return static_cast<uint8_t>(value);
    }

    Core::Expected<Rgb> ParseHex(std::string_view hex)
    {
        static const std::regex kPattern{"^#?([a-f\\d]{2})([a-f\\d]{2})([a-f\\d]{2})$", std::regex::icase};

        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_match(hex.begin(), hex.end(), match, kPattern))
            return Core::Err<Rgb>(Core::ErrorCode::InvalidFormat);

        auto group = [&](std::size_t i)
        {
            return std::string_view(hex.data() + match.position(i), static_cast<std::size_t>(match.length(i)));
        };

        return Rgb{ParseByte(group(1)), ParseByte(group(2)), ParseByte(group(3))};
    }

    std::string ToHex(Rgb color)
    {
        return std::format("#{:02x}{:02x}{:02x}", color.R, color.G, color.B);
    }

    Hsv RgbToHsv(Rgb color)
    {
        const double r = color.R / 255.0;
        const double g = color.G / 255.0;
        const double b = color.B / 255.0;

        const double max = std::max({r, g, b});
        const double min = std::min({r, g, b});
        const double d = max - min;

        Hsv out;
        out.S = (max == 0.0) ? 0.0 : d / max;
        out.V = max;

        if (d != 0.0)
        {
            if (max == r)
                out.H = ((g - b) / d + (g < b ? 6.0 : 0.0)) / 6.0;
            else if (max == g)
                out.H = ((b - r) / d + 2.0) / 6.0;
            else
                out.H = ((r - g) / d + 4.0) / 6.0;
        }
        return out;
    }

    Rgb HsvToRgb(const Hsv& color)
    {
        const double h = color.H;
        const double s = color.S;
        const double v = color.V;

        const double sector = std::floor(h * 6.0);
        const double f = h * 6.0 - sector;
        const double p = v * (1.0 - s);
        const double q = v * (1.0 - f * s);
        const double t = v * (1.0 - (1.0 - f) * s);

        double r = 0.0, g = 0.0, b = 0.0;
        switch (((static_cast<int>(sector) % 6) + 6) % 6)
        {
            case 0: r = v; g = t; b = p; break;
            case 1: r = q; g = v; b = p; break;
            case 2: r = p; g = v; b = t; break;
            case 3: r = p; g = q; b = v; break;
            case 4: r = t; g = p; b = v; break;
            case 5: r = v; g = p; b = q; break;
        }

        return Rgb{ClampChannel(r * 255.0), ClampChannel(g * 255.0), ClampChannel(b * 255.0)};
    }

    Core::Expected<InterpolationMode> ParseInterpolationMode(std::string_view name)
    {
        if (name == "linear") return InterpolationMode::Linear;
        if (name == "hsv")    return InterpolationMode::Hsv;
        return Core::Err<InterpolationMode>(Core::ErrorCode::InvalidArgument);
    }

    Rgb Interpolate(Rgb start, Rgb end, double t, InterpolationMode mode)
    {
        if (mode == InterpolationMode::Linear)
        {
            auto lerp = [t](uint8_t a, uint8_t b) { return ClampChannel(a + (static_cast<double>(b) - a) * t); };
            return Rgb{lerp(start.R, end.R), lerp(start.G, end.G), lerp(start.B, end.B)};
        }

        const Hsv a = RgbToHsv(start);
        const Hsv b = RgbToHsv(end);

        // Take the shorter way around the hue circle
        double hueDelta = b.H - a.H;
        if (std::abs(hueDelta) > 0.5)
            hueDelta += (hueDelta > 0.0) ? -1.0 : 1.0;

        Hsv mixed;
        mixed.H = a.H + hueDelta * t;
        if (mixed.H < 0.0) mixed.H += 1.0;
        if (mixed.H >= 1.0) mixed.H -= 1.0;
        mixed.S = a.S + (b.S - a.S) * t;
        mixed.V = a.V + (b.V - a.V) * t;

        return HsvToRgb(mixed);
    }

    std::string Interpolate(std::string_view startHex, std::string_view endHex, double t,
        InterpolationMode mode)
    {
        const auto start = ParseHex(startHex);
        const auto end = ParseHex(endHex);
        if (!start || !end)
            return std::string(startHex);

        return ToHex(Interpolate(*start, *end, t, mode));
    }
}
