module;

#include <cstdint>

export module Cloner:Random;

export namespace Cloner
{
    // -------------------------------------------------------------------------
    // Seeded linear congruential generator
    // -------------------------------------------------------------------------
    //
    // state' = (state * 1103515245 + 12345) mod 2^31
    //
    // The stream is a pure function of (seed, number of draws). Any integer
    // seed is accepted, including zero and negative values (they wrap into the
    // 64-bit state and are folded into 31 bits by the first draw).
    //
    // Per-instance streams are built by seeding a fresh generator with
    // (seed + instanceIndex), which makes the draws for an instance independent
    // of the order in which a list is processed.
    class SeededRandom
    {
    public:
        explicit SeededRandom(std::int64_t seed) noexcept
            : m_State(static_cast<std::uint64_t>(seed))
        {
        }

        // Uniform in [0, 1).
        [[nodiscard]] double Next() noexcept
        {
            m_State = (m_State * kMultiplier + kIncrement) & kStateMask;
            return static_cast<double>(m_State) / kModulus;
        }

        // min + Next() * (max - min)
        [[nodiscard]] double Range(double min, double max) noexcept
        {
            return min + Next() * (max - min);
        }

        // (Next() - 0.5) * 2 * extent, i.e. uniform in [-extent, +extent).
        [[nodiscard]] double Jitter(double extent) noexcept
        {
            return (Next() - 0.5) * 2.0 * extent;
        }

    private:
        static constexpr std::uint64_t kMultiplier = 1103515245ull;
        static constexpr std::uint64_t kIncrement = 12345ull;
        static constexpr std::uint64_t kStateMask = 0x7fffffffull;
        static constexpr double kModulus = 2147483648.0;

        std::uint64_t m_State;
    };
}
