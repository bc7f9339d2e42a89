module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>
#include <glm/geometric.hpp>

module Cloner:Spline.Impl;

import :Spline;
import Core.Error;

namespace Cloner::Spline
{
    struct SegmentCoord
    {
        std::size_t Segment;
        float Local;
    };

    // Requires at least two control points.
    static SegmentCoord Locate(std::size_t pointCount, float t)
    {
        const std::size_t n = pointCount - 1;
        const float scaled = t * static_cast<float>(n);
        const std::size_t segment = std::min(static_cast<std::size_t>(std::max(std::floor(scaled), 0.0f)), n - 1);
        return {segment, scaled - static_cast<float>(segment)};
    }

    static float CatmullRom1D(float p0, float p1, float p2, float p3, float t, float c)
    {
        const float t2 = t * t;
        const float t3 = t2 * t;
        return (-c * p0 + (2.0f - c) * p1 + (c - 2.0f) * p2 + c * p3) * t3 +
               (2.0f * c * p0 + (c - 3.0f) * p1 + (3.0f - 2.0f * c) * p2 - c * p3) * t2 +
               (-c * p0 + c * p2) * t +
               p1;
    }

    static glm::vec3 NormalizeOrX(const glm::vec3& d)
    {
        const float len = glm::length(d);
        return len > 0.0f ? d / len : glm::vec3(1.0f, 0.0f, 0.0f);
    }

    Core::Expected<CurveType> ParseCurveType(std::string_view name)
    {
        if (name == "linear")     return CurveType::Linear;
        if (name == "catmullrom") return CurveType::CatmullRom;
        if (name == "bezier")     return CurveType::Bezier;
        return Core::Err<CurveType>(Core::ErrorCode::InvalidArgument);
    }

    glm::vec3 EvaluateLinear(std::span<const glm::vec3> points, float t)
    {
        if (points.empty()) return glm::vec3(0.0f);
        if (points.size() == 1 || t <= 0.0f) return points.front();
        if (t >= 1.0f) return points.back();

        const auto [segment, local] = Locate(points.size(), t);
        const glm::vec3& a = points[segment];
        const glm::vec3& b = points[segment + 1];
        return a + (b - a) * local;
    }

    glm::vec3 EvaluateCatmullRom(std::span<const glm::vec3> points, float t, float tension)
    {
        if (points.empty()) return glm::vec3(0.0f);
        if (points.size() == 1 || t <= 0.0f) return points.front();
        if (t >= 1.0f) return points.back();

        const std::size_t n = points.size() - 1;
        const auto [segment, local] = Locate(points.size(), t);

        const glm::vec3& p0 = points[segment == 0 ? 0 : segment - 1];
        const glm::vec3& p1 = points[segment];
        const glm::vec3& p2 = points[std::min(n, segment + 1)];
        const glm::vec3& p3 = points[std::min(n, segment + 2)];

        const float c = (1.0f - tension) * 0.5f;
        return {
            CatmullRom1D(p0.x, p1.x, p2.x, p3.x, local, c),
            CatmullRom1D(p0.y, p1.y, p2.y, p3.y, local, c),
            CatmullRom1D(p0.z, p1.z, p2.z, p3.z, local, c),
        };
    }

    glm::vec3 Evaluate(std::span<const glm::vec3> points, float t, CurveType type, float tension)
    {
        switch (type)
        {
            case CurveType::CatmullRom: return EvaluateCatmullRom(points, t, tension);
            case CurveType::Linear:
            case CurveType::Bezier:     return EvaluateLinear(points, t);
        }
        return EvaluateLinear(points, t);
    }

    glm::vec3 LinearTangent(std::span<const glm::vec3> points, float t)
    {
        if (points.size() < 2) return glm::vec3(1.0f, 0.0f, 0.0f);

        const SegmentCoord coord = Locate(points.size(), std::clamp(t, 0.0f, 1.0f));
        return NormalizeOrX(points[coord.Segment + 1] - points[coord.Segment]);
    }

    glm::vec3 CatmullRomTangent(std::span<const glm::vec3> points, float t, float tension)
    {
        const float t0 = std::max(0.0f, t - kTangentEpsilon);
        const float t1 = std::min(1.0f, t + kTangentEpsilon);
        return NormalizeOrX(EvaluateCatmullRom(points, t1, tension) - EvaluateCatmullRom(points, t0, tension));
    }

    glm::vec3 Tangent(std::span<const glm::vec3> points, float t, CurveType type, float tension)
    {
        switch (type)
        {
            case CurveType::CatmullRom: return CatmullRomTangent(points, t, tension);
            case CurveType::Linear:
            case CurveType::Bezier:     return LinearTangent(points, t);
        }
        return LinearTangent(points, t);
    }

    glm::vec3 TangentToRotation(const glm::vec3& tangent)
    {
        const float yaw = std::atan2(tangent.x, tangent.z);
        const float pitch = std::atan2(-tangent.y, std::sqrt(tangent.x * tangent.x + tangent.z * tangent.z));
        return {pitch, yaw, 0.0f};
    }

    float ArcLengthTable::ParameterAt(float fraction) const
    {
        const float total = TotalLength();
        if (Params.size() < 2 || total <= 0.0f)
            return fraction;

        const float target = std::clamp(fraction, 0.0f, 1.0f) * total;
        const auto it = std::lower_bound(Lengths.begin(), Lengths.end(), target);
        if (it == Lengths.begin()) return Params.front();
        if (it == Lengths.end()) return Params.back();

        const std::size_t hi = static_cast<std::size_t>(it - Lengths.begin());
        const std::size_t lo = hi - 1;
        const float span = Lengths[hi] - Lengths[lo];
        const float w = span > 0.0f ? (target - Lengths[lo]) / span : 0.0f;
        return Params[lo] + (Params[hi] - Params[lo]) * w;
    }

    ArcLengthTable BuildArcLengthTable(std::span<const glm::vec3> points, CurveType type, float tension,
        std::size_t samplesPerSegment)
    {
        ArcLengthTable table;
        if (points.size() < 2 || samplesPerSegment == 0)
            return table;

        const std::size_t samples = samplesPerSegment * (points.size() - 1);
        table.Params.reserve(samples + 1);
        table.Lengths.reserve(samples + 1);

        glm::vec3 prev = Evaluate(points, 0.0f, type, tension);
        float accumulated = 0.0f;
        table.Params.push_back(0.0f);
        table.Lengths.push_back(0.0f);

        for (std::size_t i = 1; i <= samples; ++i)
        {
            const float t = static_cast<float>(i) / static_cast<float>(samples);
            const glm::vec3 p = Evaluate(points, t, type, tension);
            accumulated += glm::length(p - prev);
            prev = p;
            table.Params.push_back(t);
            table.Lengths.push_back(accumulated);
        }
        return table;
    }
}
