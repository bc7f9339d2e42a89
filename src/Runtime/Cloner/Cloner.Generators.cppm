module;

#include <cstddef>
#include <cstdint>
#include <vector>

export module Cloner:Generators;

import :Instance;
import :Config;

export namespace Cloner::Generators
{
    // =========================================================================
    // Placement generators
    // =========================================================================
    //
    // Each generator is a pure function of its configuration. Instances come
    // back in generation order with Index == list position and ids prefixed
    // by the mode name. Randomized modes draw from an explicit seed, so the
    // same configuration always yields the same list.

    // Grid jitter is seeded with a fixed value shared by every grid.
    inline constexpr std::int64_t kGridVariationSeed = 12345;

    // Scatter gives up after Count * kScatterAttemptsPerInstance candidates.
    inline constexpr std::uint32_t kScatterAttemptsPerInstance = 10;

    // Half-extent of the fallback scatter volume when no bounds are given.
    inline constexpr float kDefaultScatterExtent = 5.0f;

    // Samples per segment for the DistributeEvenly arc-length table.
    inline constexpr std::size_t kArcLengthSamplesPerSegment = 64;

    [[nodiscard]] std::vector<Instance> GenerateLinear(const LinearConfig& config);
    [[nodiscard]] std::vector<Instance> GenerateRadial(const RadialConfig& config);
    [[nodiscard]] std::vector<Instance> GenerateGrid(const GridConfig& config);
    [[nodiscard]] std::vector<Instance> GenerateScatter(const ScatterConfig& config);
    [[nodiscard]] std::vector<Instance> GenerateSpline(const SplineConfig& config);
    [[nodiscard]] std::vector<Instance> GenerateObject(const ObjectConfig& config);
}
