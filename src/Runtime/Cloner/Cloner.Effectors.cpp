module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <glm/geometric.hpp>

module Cloner:Effectors.Impl;

import :Effectors;
import :Instance;
import :Config;
import :Random;
import :Noise;
import Core.Error;

namespace Cloner
{
    // Offset applied to one input axis to decorrelate the Y and Z noise samples.
    static constexpr double kNoiseDecorrelationOffset = 100.0;

    static constexpr float kFalloffHideThreshold = 0.9f;
    static constexpr float kStepHideThreshold = 0.5f;

    namespace
    {
        template<class... Ts>
        struct Overloaded : Ts... { using Ts::operator()...; };
    }

    EffectorKind GetKind(const Effector& effector)
    {
        return static_cast<EffectorKind>(effector.index());
    }

    const EffectorBase& GetBase(const Effector& effector)
    {
        return std::visit([](const auto& e) -> const EffectorBase& { return e; }, effector);
    }

    EffectorBase& GetBase(Effector& effector)
    {
        return std::visit([](auto& e) -> EffectorBase& { return e; }, effector);
    }

    std::string_view EffectorKindName(EffectorKind kind)
    {
        switch (kind)
        {
            case EffectorKind::Falloff: return "falloff";
            case EffectorKind::Random:  return "random";
            case EffectorKind::Noise:   return "noise";
            case EffectorKind::Step:    return "step";
            case EffectorKind::Target:  return "target";
        }
        return "unknown";
    }

    Core::Expected<EffectorKind> ParseEffectorKind(std::string_view name)
    {
        if (name == "falloff") return EffectorKind::Falloff;
        if (name == "random")  return EffectorKind::Random;
        if (name == "noise")   return EffectorKind::Noise;
        if (name == "step")    return EffectorKind::Step;
        if (name == "target")  return EffectorKind::Target;
        return Core::Err<EffectorKind>(Core::ErrorCode::InvalidArgument);
    }

    Effector MakeDefaultEffector(EffectorKind kind, std::int32_t seed)
    {
        auto withBase = [kind](auto effector)
        {
            effector.Id = std::string("effector-").append(EffectorKindName(kind));
            effector.Name = std::string(EffectorKindName(kind)).append(" effector");
            return Effector{std::move(effector)};
        };

        switch (kind)
        {
            case EffectorKind::Falloff: return withBase(FalloffEffector{});
            case EffectorKind::Random:
            {
                RandomEffector e;
                e.Seed = seed;
                return withBase(std::move(e));
            }
            case EffectorKind::Noise:   return withBase(NoiseEffector{});
            case EffectorKind::Step:    return withBase(StepEffector{});
            case EffectorKind::Target:  return withBase(TargetEffector{});
        }
        return withBase(FalloffEffector{});
    }

    static float FalloffDistance(const FalloffEffector& effector, const glm::vec3& position)
    {
        const glm::vec3 d = position - effector.Center;
        switch (effector.Shape)
        {
            case FalloffShape::Spherical:
                return glm::length(d);
            case FalloffShape::Cylindrical:
                switch (effector.CylinderAxis)
                {
                    case Axis::X: return std::sqrt(d.y * d.y + d.z * d.z);
                    case Axis::Y: return std::sqrt(d.x * d.x + d.z * d.z);
                    case Axis::Z: return std::sqrt(d.x * d.x + d.y * d.y);
                }
                break;
            case FalloffShape::Box:
                return std::max({std::abs(d.x), std::abs(d.y), std::abs(d.z)});
            case FalloffShape::Linear:
                return std::abs(d.x);
        }
        return std::abs(d.x);
    }

    float FalloffFactor(const FalloffEffector& effector, const glm::vec3& position)
    {
        // A non-positive radius has no interior: everything is outside.
        float factor = 0.0f;
        if (effector.Radius > 0.0f)
            factor = 1.0f - std::min(FalloffDistance(effector, position) / effector.Radius, 1.0f);

        switch (effector.Curve)
        {
            case FalloffCurve::Smooth: factor = factor * factor * (3.0f - 2.0f * factor); break;
            case FalloffCurve::Sharp:  factor = factor * factor; break;
            case FalloffCurve::Linear: break;
        }

        if (effector.Invert)
            factor = 1.0f - factor;

        return factor * effector.Strength;
    }

    float StepFactor(const StepEffector& effector, std::uint32_t index)
    {
        // A zero step size has no bands.
        if (effector.StepSize == 0.0f)
            return 0.0f;

        const double band = std::floor((static_cast<double>(index) + effector.Offset) / effector.StepSize);
        const bool even = std::fmod(band, 2.0) == 0.0;
        return (even ? 1.0f : 0.0f) * effector.Strength;
    }

    // Shrinks toward half size as factor approaches 1.
    static void ShrinkScale(Instance& instance, float factor)
    {
        instance.Scale *= 1.0f - factor * 0.5f;
    }

    static Instance ApplyFalloff(Instance instance, const FalloffEffector& effector)
    {
        const float factor = FalloffFactor(effector, instance.Position);

        if (effector.Affects.Scale)
            ShrinkScale(instance, factor);
        if (effector.Affects.Visibility)
            instance.Visible = factor < kFalloffHideThreshold;

        return instance;
    }

    static Instance ApplyRandom(Instance instance, const RandomEffector& effector)
    {
        SeededRandom rng(static_cast<std::int64_t>(effector.Seed) + instance.Index);
        const double strength = effector.Strength;

        if (effector.Affects.Position)
        {
            instance.Position.x += static_cast<float>(rng.Jitter(effector.PositionRange.x) * strength);
            instance.Position.y += static_cast<float>(rng.Jitter(effector.PositionRange.y) * strength);
            instance.Position.z += static_cast<float>(rng.Jitter(effector.PositionRange.z) * strength);
        }

        if (effector.Affects.Rotation)
        {
            const glm::vec3 range = glm::radians(effector.RotationRange);
            instance.Rotation.x += static_cast<float>(rng.Jitter(range.x) * strength);
            instance.Rotation.y += static_cast<float>(rng.Jitter(range.y) * strength);
            instance.Rotation.z += static_cast<float>(rng.Jitter(range.z) * strength);
        }

        if (effector.Affects.Scale)
        {
            const double lo = effector.ScaleRange.x;
            const double hi = effector.ScaleRange.y;
            // The shared draw is consumed even when scale is non-uniform.
            const float shared = static_cast<float>(rng.Range(lo, hi));
            if (effector.UniformScale)
            {
                instance.Scale *= shared;
            }
            else
            {
                instance.Scale.x *= static_cast<float>(rng.Range(lo, hi));
                instance.Scale.y *= static_cast<float>(rng.Range(lo, hi));
                instance.Scale.z *= static_cast<float>(rng.Range(lo, hi));
            }
        }

        return instance;
    }

    static Instance ApplyNoise(Instance instance, const NoiseEffector& effector)
    {
        const double x = instance.Position.x;
        const double y = instance.Position.y;
        const double z = instance.Position.z;
        const double gain = static_cast<double>(effector.Amplitude) * effector.Strength;

        auto sample = [&](double sx, double sy, double sz)
        {
            return Noise::Fractal(sx, sy, sz, effector.Frequency, effector.Octaves) * gain;
        };

        const double primary = sample(x, y, z);

        if (effector.Affects.Position)
        {
            instance.Position.x += static_cast<float>(primary);
            instance.Position.y += static_cast<float>(sample(x + kNoiseDecorrelationOffset, y, z));
            instance.Position.z += static_cast<float>(sample(x, y + kNoiseDecorrelationOffset, z));
        }

        if (effector.Affects.Scale)
            instance.Scale *= static_cast<float>(1.0 + primary * 0.5);

        return instance;
    }

    static Instance ApplyStep(Instance instance, const StepEffector& effector)
    {
        const float factor = StepFactor(effector, instance.Index);

        if (effector.Affects.Scale)
            ShrinkScale(instance, factor);
        if (effector.Affects.Visibility)
            instance.Visible = factor < kStepHideThreshold;

        return instance;
    }

    static Instance ApplyTarget(Instance instance, const TargetEffector& effector)
    {
        const glm::vec3 toTarget = effector.TargetPosition - instance.Position;
        const float dist = glm::length(toTarget);

        // Nothing outside the radius, and no direction at the target itself.
        if (!(dist < effector.InfluenceRadius) || dist <= 0.0f)
            return instance;

        const float influence = (1.0f - dist / effector.InfluenceRadius) * effector.Strength;
        const float attraction = effector.AttractionStrength * influence;

        if (effector.Affects.Position)
            instance.Position += (toTarget / dist) * attraction;

        return instance;
    }

    Instance ApplyEffector(Instance instance, const Effector& effector)
    {
        if (!GetBase(effector).Enabled)
            return instance;

        return std::visit(Overloaded{
            [&](const FalloffEffector& e) { return ApplyFalloff(std::move(instance), e); },
            [&](const RandomEffector& e)  { return ApplyRandom(std::move(instance), e); },
            [&](const NoiseEffector& e)   { return ApplyNoise(std::move(instance), e); },
            [&](const StepEffector& e)    { return ApplyStep(std::move(instance), e); },
            [&](const TargetEffector& e)  { return ApplyTarget(std::move(instance), e); },
        }, effector);
    }

    std::vector<Instance> ApplyEffectors(std::span<const Instance> instances, std::span<const Effector> effectors)
    {
        std::vector<Instance> result;
        result.reserve(instances.size());

        for (const Instance& source : instances)
        {
            Instance current = source;
            for (const Effector& effector : effectors)
                current = ApplyEffector(std::move(current), effector);
            result.push_back(std::move(current));
        }

        return result;
    }
}
