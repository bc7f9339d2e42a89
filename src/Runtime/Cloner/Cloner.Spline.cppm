module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

export module Cloner:Spline;

import Core.Error;

export namespace Cloner::Spline
{
    // =========================================================================
    // Poly-line evaluation
    // =========================================================================
    //
    // A curve is a poly-line of N control points parameterized by t in [0, 1].
    // The parameter is split uniformly over the N-1 segments:
    //
    //   segment = min(floor(t * (N-1)), N-2),  local = t * (N-1) - segment
    //
    // Linear:     p = p1 + (p2 - p1) * local
    // CatmullRom: cardinal spline over the window (p0, p1, p2, p3) with
    //             c = (1 - tension) / 2. The window is clamped to the end
    //             control points (no wraparound).
    // Bezier:     evaluated with the linear algorithm.
    //
    // Evaluation at t <= 0 and t >= 1 returns the first and last control point
    // exactly. An empty poly-line evaluates to the origin, a single control
    // point evaluates to itself for every t.

    enum class CurveType : uint8_t
    {
        Linear,
        CatmullRom,
        Bezier
    };

    inline constexpr float kDefaultTension = 0.5f;

    // Half-width of the finite difference used for Catmull-Rom tangents.
    inline constexpr float kTangentEpsilon = 0.001f;

    [[nodiscard]] Core::Expected<CurveType> ParseCurveType(std::string_view name);

    [[nodiscard]] glm::vec3 EvaluateLinear(std::span<const glm::vec3> points, float t);
    [[nodiscard]] glm::vec3 EvaluateCatmullRom(std::span<const glm::vec3> points, float t, float tension);
    [[nodiscard]] glm::vec3 Evaluate(std::span<const glm::vec3> points, float t, CurveType type,
        float tension = kDefaultTension);

    // Unit direction of the segment containing t. Falls back to +X when the
    // segment has zero length or there is no segment.
    [[nodiscard]] glm::vec3 LinearTangent(std::span<const glm::vec3> points, float t);

    // Unit direction of p(t + eps) - p(t - eps), both parameters clamped to
    // [0, 1]. Falls back to +X when the difference vanishes.
    [[nodiscard]] glm::vec3 CatmullRomTangent(std::span<const glm::vec3> points, float t, float tension);

    [[nodiscard]] glm::vec3 Tangent(std::span<const glm::vec3> points, float t, CurveType type,
        float tension = kDefaultTension);

    // Euler XYZ rotation (radians) that points local +Z along the tangent:
    //   pitch = atan2(-ty, sqrt(tx^2 + tz^2)),  yaw = atan2(tx, tz),  roll = 0
    [[nodiscard]] glm::vec3 TangentToRotation(const glm::vec3& tangent);

    // -------------------------------------------------------------------------
    // Arc-length reparameterization
    // -------------------------------------------------------------------------
    //
    // Samples the curve uniformly in t and accumulates chord lengths so a
    // fraction of the total length can be mapped back to a curve parameter.
    struct ArcLengthTable
    {
        std::vector<float> Params;
        std::vector<float> Lengths;

        [[nodiscard]] float TotalLength() const { return Lengths.empty() ? 0.0f : Lengths.back(); }

        // Parameter at which the accumulated length reaches fraction * TotalLength().
        // Returns `fraction` itself when the curve has no length.
        [[nodiscard]] float ParameterAt(float fraction) const;
    };

    [[nodiscard]] ArcLengthTable BuildArcLengthTable(std::span<const glm::vec3> points, CurveType type,
        float tension = kDefaultTension, std::size_t samplesPerSegment = 64);
}
