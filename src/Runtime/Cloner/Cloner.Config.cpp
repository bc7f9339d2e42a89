module;

#include <cstdint>
#include <string_view>
#include <variant>

#include <glm/glm.hpp>

module Cloner:Config.Impl;

import :Config;
import :Spline;
import Core.Error;

namespace Cloner
{
    Mode GetMode(const ClonerConfig& config)
    {
        return static_cast<Mode>(config.index());
    }

    std::string_view ModeName(Mode mode)
    {
        switch (mode)
        {
            case Mode::Linear:  return "linear";
            case Mode::Radial:  return "radial";
            case Mode::Grid:    return "grid";
            case Mode::Scatter: return "scatter";
            case Mode::Spline:  return "spline";
            case Mode::Object:  return "object";
        }
        return "unknown";
    }

    Core::Expected<Mode> ParseMode(std::string_view name)
    {
        if (name == "linear")  return Mode::Linear;
        if (name == "radial")  return Mode::Radial;
        if (name == "grid")    return Mode::Grid;
        if (name == "scatter") return Mode::Scatter;
        if (name == "spline")  return Mode::Spline;
        if (name == "object")  return Mode::Object;
        return Core::Err<Mode>(Core::ErrorCode::InvalidArgument);
    }

    Core::Expected<Plane> ParsePlane(std::string_view name)
    {
        if (name == "xy") return Plane::XY;
        if (name == "xz") return Plane::XZ;
        if (name == "yz") return Plane::YZ;
        return Core::Err<Plane>(Core::ErrorCode::InvalidArgument);
    }

    Core::Expected<Axis> ParseAxis(std::string_view name)
    {
        if (name == "x") return Axis::X;
        if (name == "y") return Axis::Y;
        if (name == "z") return Axis::Z;
        return Core::Err<Axis>(Core::ErrorCode::InvalidArgument);
    }

    ClonerConfig MakeDefaultConfig(Mode mode, std::int32_t seed)
    {
        switch (mode)
        {
            case Mode::Linear:
                return LinearConfig{};
            case Mode::Radial:
                return RadialConfig{};
            case Mode::Grid:
                return GridConfig{};
            case Mode::Scatter:
            {
                ScatterConfig config;
                config.Box = BoundingBox{{-5.0f, 0.0f, -5.0f}, {5.0f, 0.0f, 5.0f}};
                config.Seed = seed;
                return config;
            }
            case Mode::Spline:
            {
                SplineConfig config;
                config.Points = {
                    {0.0f, 0.0f, 0.0f},
                    {2.0f, 1.0f, 0.0f},
                    {4.0f, 0.0f, 0.0f},
                    {6.0f, 1.0f, 0.0f},
                };
                return config;
            }
            case Mode::Object:
                return ObjectConfig{};
        }
        return LinearConfig{};
    }
}
