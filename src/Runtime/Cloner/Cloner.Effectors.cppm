module;

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

export module Cloner:Effectors;

import Core.Error;
import :Instance;
import :Config;

export namespace Cloner
{
    // =========================================================================
    // Effectors
    // =========================================================================
    //
    // An effector perturbs instances that a generator already placed. A list
    // of effectors is applied per instance as a left fold in list order; each
    // effector sees the state left by the previous one, so order matters.
    // Disabled effectors are skipped. Every effector only touches the fields
    // it honors in its Affects mask:
    //
    //   Falloff  scale, visibility
    //   Random   position, rotation, scale
    //   Noise    position, scale
    //   Step     scale, visibility
    //   Target   position
    //
    // Instances never see each other here, so applying one effector to many
    // instances can be split across threads freely.

    enum class EffectorKind : uint8_t
    {
        Falloff,
        Random,
        Noise,
        Step,
        Target
    };

    struct AffectsMask
    {
        bool Position{true};
        bool Rotation{false};
        bool Scale{false};
        bool Color{false};
        bool Visibility{false};
    };

    struct EffectorBase
    {
        std::string Id;
        std::string Name;
        bool Enabled{true};
        // Global multiplier on the effector's influence, in [0, 1].
        float Strength{1.0f};
        AffectsMask Affects{};
    };

    enum class FalloffShape : uint8_t
    {
        Linear,      // |dx|
        Spherical,   // Euclidean
        Cylindrical, // Euclidean ignoring CylinderAxis
        Box          // Chebyshev
    };

    enum class FalloffCurve : uint8_t
    {
        Linear, // f
        Smooth, // 3f^2 - 2f^3
        Sharp   // f^2
    };

    struct FalloffEffector : EffectorBase
    {
        FalloffShape Shape{FalloffShape::Spherical};
        Axis CylinderAxis{Axis::Y};
        glm::vec3 Center{0.0f};
        float Radius{5.0f};
        FalloffCurve Curve{FalloffCurve::Smooth};
        bool Invert{false};
    };

    struct RandomEffector : EffectorBase
    {
        std::int32_t Seed{0};
        glm::vec3 PositionRange{0.5f};
        // Degrees
        glm::vec3 RotationRange{45.0f};
        // Multiplier range [min, max)
        glm::vec2 ScaleRange{0.8f, 1.2f};
        bool UniformScale{true};
    };

    struct NoiseEffector : EffectorBase
    {
        float Frequency{1.0f};
        std::uint32_t Octaves{1};
        float Amplitude{1.0f};
        // Consumed by an external animation driver, never read here.
        std::optional<float> AnimationSpeed;
    };

    struct StepEffector : EffectorBase
    {
        float StepSize{2.0f};
        float Offset{0.0f};
    };

    struct TargetEffector : EffectorBase
    {
        glm::vec3 TargetPosition{0.0f};
        float InfluenceRadius{5.0f};
        // Positive attracts, negative repels.
        float AttractionStrength{1.0f};
    };

    // Alternative order matches EffectorKind.
    using Effector = std::variant<FalloffEffector, RandomEffector, NoiseEffector, StepEffector, TargetEffector>;

    [[nodiscard]] EffectorKind GetKind(const Effector& effector);
    [[nodiscard]] const EffectorBase& GetBase(const Effector& effector);
    [[nodiscard]] EffectorBase& GetBase(Effector& effector);

    [[nodiscard]] std::string_view EffectorKindName(EffectorKind kind);
    [[nodiscard]] Core::Expected<EffectorKind> ParseEffectorKind(std::string_view name);

    // Editor defaults: enabled, full strength, affects position only.
    [[nodiscard]] Effector MakeDefaultEffector(EffectorKind kind, std::int32_t seed = 0);

    // Falloff weight at `position` after curve, inversion and strength.
    [[nodiscard]] float FalloffFactor(const FalloffEffector& effector, const glm::vec3& position);

    // Step banding weight for a generation-time instance index, after strength.
    [[nodiscard]] float StepFactor(const StepEffector& effector, std::uint32_t index);

    // One fold step. Disabled effectors return the instance unchanged.
    [[nodiscard]] Instance ApplyEffector(Instance instance, const Effector& effector);

    // Same length and order as `instances`.
    [[nodiscard]] std::vector<Instance> ApplyEffectors(std::span<const Instance> instances,
        std::span<const Effector> effectors);
}
