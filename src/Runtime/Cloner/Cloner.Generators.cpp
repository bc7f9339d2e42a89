module;

#include <cmath>
#include <cstdint>
#include <numbers>
#include <optional>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <glm/geometric.hpp>

module Cloner:Generators.Impl;

import :Generators;
import :Instance;
import :Config;
import :Random;
import :Color;
import :Spline;
import Core.Error;
import Core.Logging;

namespace Cloner::Generators
{
    static constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;

    // Progression parameter in [0, 1]; 0 when there is a single instance.
    static float Progress(std::uint32_t i, std::uint32_t count)
    {
        return count > 1 ? static_cast<float>(i) / static_cast<float>(count - 1) : 0.0f;
    }

    static glm::vec3 ProgressiveScale(const std::optional<float>& progression, std::uint32_t i)
    {
        if (!progression) return glm::vec3(1.0f);
        return glm::vec3(std::pow(*progression, static_cast<float>(i)));
    }

    static glm::vec3 ProgressiveRotation(const std::optional<glm::vec3>& degreesPerStep, std::uint32_t i)
    {
        if (!degreesPerStep) return glm::vec3(0.0f);
        return glm::radians(*degreesPerStep * static_cast<float>(i));
    }

    static glm::vec3 DirectionVector(const LinearConfig& config)
    {
        glm::vec3 dir{1.0f, 0.0f, 0.0f};
        switch (config.Direction)
        {
            case LinearDirection::X: dir = {1.0f, 0.0f, 0.0f}; break;
            case LinearDirection::Y: dir = {0.0f, 1.0f, 0.0f}; break;
            case LinearDirection::Z: dir = {0.0f, 0.0f, 1.0f}; break;
            case LinearDirection::Custom: dir = config.CustomDirection.value_or(glm::vec3(1.0f, 0.0f, 0.0f)); break;
        }

        // A zero-length custom direction stays as-is: every instance lands on the offset.
        const float len = glm::length(dir);
        return len > 0.0f ? dir / len : dir;
    }

    std::vector<Instance> GenerateLinear(const LinearConfig& config)
    {
        std::vector<Instance> instances;
        instances.reserve(config.Count);

        const glm::vec3 dir = DirectionVector(config);

        // Endpoints are parsed once. An unparsable endpoint gives every
        // instance the start string unchanged.
        std::optional<Color::Rgb> startColor;
        std::optional<Color::Rgb> endColor;
        if (config.Colors)
        {
            const auto start = Color::ParseHex(config.Colors->StartColor);
            const auto end = Color::ParseHex(config.Colors->EndColor);
            if (start && end)
            {
                startColor = *start;
                endColor = *end;
            }
        }

        for (std::uint32_t i = 0; i < config.Count; ++i)
        {
            Instance inst;
            inst.Id = MakeInstanceId("linear", i);
            inst.Index = i;
            inst.Position = dir * (config.Spacing * static_cast<float>(i)) + config.Offset;
            inst.Rotation = ProgressiveRotation(config.RotationProgression, i);
            inst.Scale = ProgressiveScale(config.ScaleProgression, i);

            if (startColor)
            {
                inst.Color = Color::ToHex(Color::Interpolate(*startColor, *endColor, Progress(i, config.Count),
                    config.Colors->Interpolation));
            }
            else if (config.Colors)
            {
                inst.Color = config.Colors->StartColor;
            }

            instances.push_back(std::move(inst));
        }

        return instances;
    }

    std::vector<Instance> GenerateRadial(const RadialConfig& config)
    {
        std::vector<Instance> instances;
        instances.reserve(config.Count);

        const float startRad = glm::radians(config.StartAngle);
        const float angleRange = glm::radians(config.EndAngle) - startRad;
        const bool spiral = config.Spiral && config.Spiral->Enabled;
        const float revolutions = angleRange / kTwoPi;

        for (std::uint32_t i = 0; i < config.Count; ++i)
        {
            // Divides by Count, not Count - 1: a closed ring does not place the
            // last instance on top of the first.
            const float angle = startRad + angleRange * (static_cast<float>(i) / static_cast<float>(config.Count));

            float height = 0.0f;
            float radius = config.Radius;
            if (spiral)
            {
                const float t = Progress(i, config.Count);
                height = config.Spiral->HeightPerRevolution * revolutions * t;
                radius += config.Spiral->RadiusGrowth * revolutions * t;
            }

            const float c = std::cos(angle) * radius;
            const float s = std::sin(angle) * radius;

            Instance inst;
            inst.Id = MakeInstanceId("radial", i);
            inst.Index = i;

            switch (config.ArcPlane)
            {
                case Plane::XY: inst.Position = {c, s, height}; break;
                case Plane::XZ: inst.Position = {c, height, s}; break;
                case Plane::YZ: inst.Position = {height, c, s}; break;
            }

            if (config.AlignToRadius)
            {
                // Rotate about the plane normal so local outward follows the angle
                switch (config.ArcPlane)
                {
                    case Plane::XY: inst.Rotation = {0.0f, 0.0f, angle}; break;
                    case Plane::XZ: inst.Rotation = {0.0f, angle, 0.0f}; break;
                    case Plane::YZ: inst.Rotation = {angle, 0.0f, 0.0f}; break;
                }
            }

            inst.Rotation += ProgressiveRotation(config.RotationProgression, i);
            inst.Scale = ProgressiveScale(config.ScaleProgression, i);

            instances.push_back(std::move(inst));
        }

        return instances;
    }

    // Lattice coordinate divided by the half-extent (count * spacing / 2).
    // A zero half-extent maps to 0 so a flat axis never masks anything.
    static float NormalizeToHalfExtent(float position, std::uint32_t count, float spacing)
    {
        const float halfExtent = static_cast<float>(count) * spacing * 0.5f;
        return halfExtent != 0.0f ? position / halfExtent : 0.0f;
    }

    static bool PassesShapeMask(const GridConfig& config, const glm::vec3& position)
    {
        if (!config.Shape || *config.Shape == GridShape::Box || *config.Shape == GridShape::Custom)
            return true;

        const glm::vec3 n{
            NormalizeToHalfExtent(position.x, config.CountX, config.SpacingX),
            NormalizeToHalfExtent(position.y, config.CountY, config.SpacingY),
            NormalizeToHalfExtent(position.z, config.CountZ, config.SpacingZ),
        };

        if (*config.Shape == GridShape::Sphere)
            return glm::length(n) <= 1.0f;

        // Cylinder around Y
        return std::sqrt(n.x * n.x + n.z * n.z) <= 1.0f;
    }

    std::vector<Instance> GenerateGrid(const GridConfig& config)
    {
        std::vector<Instance> instances;
        instances.reserve(static_cast<std::size_t>(config.CountX) * config.CountY * config.CountZ);

        SeededRandom rng(kGridVariationSeed);

        glm::vec3 centerOffset{0.0f};
        if (config.Centered)
        {
            // count == 0 never reaches the loop below, so the offset is unused there.
            auto half = [](std::uint32_t count, float spacing)
            {
                return count > 0 ? -(static_cast<float>(count - 1) * spacing) * 0.5f : 0.0f;
            };
            centerOffset = {half(config.CountX, config.SpacingX), half(config.CountY, config.SpacingY),
                half(config.CountZ, config.SpacingZ)};
        }

        const bool scaleJitter = config.ScaleVariation && *config.ScaleVariation != 0.0f;

        std::uint32_t index = 0;
        for (std::uint32_t x = 0; x < config.CountX; ++x)
        {
            for (std::uint32_t y = 0; y < config.CountY; ++y)
            {
                for (std::uint32_t z = 0; z < config.CountZ; ++z)
                {
                    const glm::vec3 position{
                        static_cast<float>(x) * config.SpacingX + centerOffset.x,
                        static_cast<float>(y) * config.SpacingY + centerOffset.y,
                        static_cast<float>(z) * config.SpacingZ + centerOffset.z,
                    };

                    if (!PassesShapeMask(config, position))
                        continue;
                    if (config.CustomMask && !config.CustomMask(x, y, z))
                        continue;

                    Instance inst;
                    inst.Id = MakeInstanceId("grid", index);
                    inst.Index = index;
                    inst.Position = position;

                    if (scaleJitter)
                    {
                        const float s = 1.0f + static_cast<float>(rng.Jitter(*config.ScaleVariation));
                        inst.Scale = glm::vec3(s);
                    }

                    if (config.RotationVariation)
                    {
                        const glm::vec3 maxRad = glm::radians(*config.RotationVariation);
                        inst.Rotation.x = static_cast<float>(rng.Jitter(maxRad.x));
                        inst.Rotation.y = static_cast<float>(rng.Jitter(maxRad.y));
                        inst.Rotation.z = static_cast<float>(rng.Jitter(maxRad.z));
                    }

                    instances.push_back(std::move(inst));
                    ++index;
                }
            }
        }

        return instances;
    }

    static glm::vec3 SampleBox(SeededRandom& rng, const glm::vec3& min, const glm::vec3& max)
    {
        glm::vec3 p;
        p.x = static_cast<float>(rng.Range(min.x, max.x));
        p.y = static_cast<float>(rng.Range(min.y, max.y));
        p.z = static_cast<float>(rng.Range(min.z, max.z));
        return p;
    }

    static glm::vec3 SampleSphere(SeededRandom& rng, const BoundingSphere& sphere)
    {
        // Rejection sample the unit ball, then scale
        double x = 0.0, y = 0.0, z = 0.0;
        do
        {
            x = rng.Range(-1.0, 1.0);
            y = rng.Range(-1.0, 1.0);
            z = rng.Range(-1.0, 1.0);
        } while (x * x + y * y + z * z > 1.0);

        return sphere.Center + glm::vec3(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)) * sphere.Radius;
    }

    static glm::vec3 SampleCandidate(SeededRandom& rng, const ScatterConfig& config)
    {
        if (config.Distribution == ScatterDistribution::Box && config.Box)
            return SampleBox(rng, config.Box->Min, config.Box->Max);
        if (config.Distribution == ScatterDistribution::Sphere && config.Sphere)
            return SampleSphere(rng, *config.Sphere);
        return SampleBox(rng, glm::vec3(-kDefaultScatterExtent), glm::vec3(kDefaultScatterExtent));
    }

    std::vector<Instance> GenerateScatter(const ScatterConfig& config)
    {
        std::vector<Instance> instances;
        instances.reserve(config.Count);

        SeededRandom rng(config.Seed);
        const bool avoidOverlap = config.AvoidOverlap && config.MinDistance > 0.0f;

        const std::uint64_t maxAttempts = static_cast<std::uint64_t>(config.Count) * kScatterAttemptsPerInstance;
        std::uint64_t attempts = 0;

        while (instances.size() < config.Count && attempts < maxAttempts)
        {
            ++attempts;

            const glm::vec3 position = SampleCandidate(rng, config);

            if (avoidOverlap)
            {
                bool tooClose = false;
                for (const Instance& placed : instances)
                {
                    if (glm::distance(position, placed.Position) < config.MinDistance)
                    {
                        tooClose = true;
                        break;
                    }
                }
                if (tooClose)
                    continue;
            }

            const auto index = static_cast<std::uint32_t>(instances.size());

            Instance inst;
            inst.Id = MakeInstanceId("scatter", index);
            inst.Index = index;
            inst.Position = position;

            if (config.UniformScale)
            {
                inst.Scale = glm::vec3(static_cast<float>(rng.Range(config.MinScale, config.MaxScale)));
            }
            else
            {
                inst.Scale.x = static_cast<float>(rng.Range(config.MinScale, config.MaxScale));
                inst.Scale.y = static_cast<float>(rng.Range(config.MinScale, config.MaxScale));
                inst.Scale.z = static_cast<float>(rng.Range(config.MinScale, config.MaxScale));
            }

            if (config.RandomRotation)
            {
                inst.Rotation.x = static_cast<float>(rng.Range(0.0, 2.0 * std::numbers::pi));
                inst.Rotation.y = static_cast<float>(rng.Range(0.0, 2.0 * std::numbers::pi));
                inst.Rotation.z = static_cast<float>(rng.Range(0.0, 2.0 * std::numbers::pi));
            }

            instances.push_back(std::move(inst));
        }

        if (instances.size() < config.Count)
        {
            Core::Log::Debug("Scatter placed {} of {} instances after {} attempts", instances.size(), config.Count,
                attempts);
        }

        return instances;
    }

    std::vector<Instance> GenerateSpline(const SplineConfig& config)
    {
        std::vector<Instance> instances;
        if (config.Points.empty())
        {
            Core::Log::Debug("Spline cloner has no control points");
            return instances;
        }

        instances.reserve(config.Count);

        // Tension is taken as given: 0 is a real tension (c = 0.5), not a
        // request for kDefaultTension.
        std::optional<Spline::ArcLengthTable> arcLength;
        if (config.DistributeEvenly)
            arcLength = Spline::BuildArcLengthTable(config.Points, config.Type, config.Tension,
                kArcLengthSamplesPerSegment);

        for (std::uint32_t i = 0; i < config.Count; ++i)
        {
            float t = Progress(i, config.Count);
            if (arcLength)
                t = arcLength->ParameterAt(t);

            Instance inst;
            inst.Id = MakeInstanceId("spline", i);
            inst.Index = i;
            inst.Position = Spline::Evaluate(config.Points, t, config.Type, config.Tension);

            if (config.AlignToSpline)
                inst.Rotation = Spline::TangentToRotation(Spline::Tangent(config.Points, t, config.Type, config.Tension));

            inst.Scale = ProgressiveScale(config.ScaleProgression, i);

            instances.push_back(std::move(inst));
        }

        return instances;
    }

    std::vector<Instance> GenerateObject(const ObjectConfig& config)
    {
        Core::Log::Debug("Object cloner '{}' needs mesh topology from the renderer; no instances generated",
            config.SourceObjectId);
        return {};
    }
}
