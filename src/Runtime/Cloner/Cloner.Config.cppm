module;

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

export module Cloner:Config;

import Core.Error;
import :Color;
import :Spline;

export namespace Cloner
{
    // -------------------------------------------------------------------------
    // Placement configuration
    // -------------------------------------------------------------------------
    //
    // One aggregate per mode, grouped into the ClonerConfig sum type. Absent
    // optionals switch the corresponding feature off (no scale progression
    // means uniform scale 1, and so on). Angles in configuration are degrees.

    enum class Mode : uint8_t
    {
        Linear,
        Radial,
        Grid,
        Scatter,
        Spline,
        Object
    };

    enum class Axis : uint8_t { X, Y, Z };

    enum class Plane : uint8_t { XY, XZ, YZ };

    enum class LinearDirection : uint8_t { X, Y, Z, Custom };

    struct ColorProgression
    {
        std::string StartColor{"#ffffff"};
        std::string EndColor{"#ffffff"};
        Color::InterpolationMode Interpolation{Color::InterpolationMode::Linear};
    };

    struct LinearConfig
    {
        std::uint32_t Count{10};
        LinearDirection Direction{LinearDirection::X};
        // Used when Direction is Custom; +X if absent. Normalized unless zero-length.
        std::optional<glm::vec3> CustomDirection;
        float Spacing{1.0f};
        glm::vec3 Offset{0.0f};

        // Instance i gets uniform scale ScaleProgression^i.
        std::optional<float> ScaleProgression;
        // Degrees added per instance, per axis.
        std::optional<glm::vec3> RotationProgression;
        std::optional<ColorProgression> Colors;
    };

    struct SpiralParams
    {
        bool Enabled{false};
        float HeightPerRevolution{0.0f};
        float RadiusGrowth{0.0f};
    };

    struct RadialConfig
    {
        std::uint32_t Count{8};
        float Radius{2.0f};
        float StartAngle{0.0f};
        float EndAngle{360.0f};
        Plane ArcPlane{Plane::XZ};
        bool AlignToRadius{true};
        std::optional<SpiralParams> Spiral;

        std::optional<float> ScaleProgression;
        std::optional<glm::vec3> RotationProgression;
    };

    enum class GridShape : uint8_t
    {
        Box,
        Sphere,
        Cylinder, // Y is the cylinder axis
        Custom    // only the custom mask filters
    };

    // Receives integer lattice indices, not world coordinates. Return false to
    // drop the lattice point.
    using GridMask = std::function<bool(std::uint32_t x, std::uint32_t y, std::uint32_t z)>;

    struct GridConfig
    {
        std::uint32_t CountX{3};
        std::uint32_t CountY{3};
        std::uint32_t CountZ{1};
        float SpacingX{1.0f};
        float SpacingY{1.0f};
        float SpacingZ{1.0f};
        bool Centered{true};

        std::optional<GridShape> Shape;
        GridMask CustomMask;

        // Uniform scale jitter in [1 - v, 1 + v). Zero disables it.
        std::optional<float> ScaleVariation;
        // Max absolute jitter per axis, degrees.
        std::optional<glm::vec3> RotationVariation;
    };

    enum class ScatterDistribution : uint8_t
    {
        Box,
        Sphere,
        Surface // needs mesh data owned by the renderer; falls back to the default box
    };

    struct BoundingBox
    {
        glm::vec3 Min{-5.0f};
        glm::vec3 Max{5.0f};
    };

    struct BoundingSphere
    {
        glm::vec3 Center{0.0f};
        float Radius{5.0f};
    };

    struct ScatterConfig
    {
        std::uint32_t Count{50};
        ScatterDistribution Distribution{ScatterDistribution::Box};
        std::optional<BoundingBox> Box;
        std::optional<BoundingSphere> Sphere;
        std::string SurfaceObjectId;

        std::int32_t Seed{0};
        float MinScale{0.8f};
        float MaxScale{1.2f};
        bool UniformScale{true};
        bool RandomRotation{true};
        bool AlignToSurface{false};

        // Candidates closer than MinDistance to an accepted instance are
        // rejected. Only active when AvoidOverlap is set and MinDistance > 0.
        bool AvoidOverlap{false};
        float MinDistance{0.0f};
    };

    struct SplineConfig
    {
        std::uint32_t Count{20};
        std::vector<glm::vec3> Points;
        Spline::CurveType Type{Spline::CurveType::CatmullRom};
        float Tension{Spline::kDefaultTension};
        bool AlignToSpline{true};
        // Space instances evenly by arc length instead of evenly in t.
        bool DistributeEvenly{false};

        std::optional<float> ScaleProgression;
    };

    enum class ObjectTarget : uint8_t { Vertices, Faces, Edges };

    // Clone onto the features of another mesh. Declared for completeness; the
    // mesh topology lives in the renderer, so generation yields no instances.
    struct ObjectConfig
    {
        std::string SourceObjectId;
        ObjectTarget Target{ObjectTarget::Vertices};
        bool AlignToNormal{true};
        float Scale{1.0f};
        bool UseSelection{false};
        std::uint32_t SkipEvery{0};
        float RandomSkip{0.0f};
    };

    // Alternative order matches Mode.
    using ClonerConfig = std::variant<LinearConfig, RadialConfig, GridConfig, ScatterConfig, SplineConfig, ObjectConfig>;

    [[nodiscard]] Mode GetMode(const ClonerConfig& config);

    [[nodiscard]] std::string_view ModeName(Mode mode);
    [[nodiscard]] Core::Expected<Mode> ParseMode(std::string_view name);
    [[nodiscard]] Core::Expected<Plane> ParsePlane(std::string_view name);
    [[nodiscard]] Core::Expected<Axis> ParseAxis(std::string_view name);

    // Editor defaults for a freshly created cloner. `seed` feeds modes that
    // need one (scatter).
    [[nodiscard]] ClonerConfig MakeDefaultConfig(Mode mode, std::int32_t seed = 0);
}
