#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

import Cloner;

using Cloner::SeededRandom;

// -----------------------------------------------------------------------------
// SeededRandom
// -----------------------------------------------------------------------------

TEST(ClonerRandom, KnownStreamForSeedZero)
{
    SeededRandom rng(0);

    // state: 12345, 1406932606, 654583775 (mod 2^31)
    EXPECT_DOUBLE_EQ(rng.Next(), 12345.0 / 2147483648.0);
    EXPECT_DOUBLE_EQ(rng.Next(), 1406932606.0 / 2147483648.0);
    EXPECT_DOUBLE_EQ(rng.Next(), 654583775.0 / 2147483648.0);
}

TEST(ClonerRandom, SameSeedSameStream)
{
    SeededRandom a(987654);
    SeededRandom b(987654);

    for (int i = 0; i < 1000; ++i)
        EXPECT_EQ(a.Next(), b.Next());
}

TEST(ClonerRandom, DifferentSeedsDiverge)
{
    SeededRandom a(1);
    SeededRandom b(2);

    int equal = 0;
    for (int i = 0; i < 100; ++i)
        if (a.Next() == b.Next()) ++equal;

    EXPECT_LT(equal, 5);
}

TEST(ClonerRandom, NextStaysInHalfOpenUnitInterval)
{
    for (std::int64_t seed : {std::int64_t{0}, std::int64_t{-1}, std::int64_t{-123456789}, std::int64_t{42},
             std::int64_t{2147483647}})
    {
        SeededRandom rng(seed);
        for (int i = 0; i < 10000; ++i)
        {
            const double v = rng.Next();
            ASSERT_GE(v, 0.0);
            ASSERT_LT(v, 1.0);
        }
    }
}

TEST(ClonerRandom, NegativeSeedIsDefined)
{
    SeededRandom rng(-1);
    EXPECT_DOUBLE_EQ(rng.Next(), 1043980748.0 / 2147483648.0);
}

TEST(ClonerRandom, RangeMapsIntoBounds)
{
    SeededRandom rng(7);
    for (int i = 0; i < 1000; ++i)
    {
        const double v = rng.Range(-3.0, 5.0);
        EXPECT_GE(v, -3.0);
        EXPECT_LT(v, 5.0);
    }
}

TEST(ClonerRandom, RangeMatchesNextFormula)
{
    SeededRandom a(99);
    SeededRandom b(99);

    const double n = a.Next();
    EXPECT_DOUBLE_EQ(b.Range(2.0, 10.0), 2.0 + n * 8.0);
}

TEST(ClonerRandom, JitterIsSymmetric)
{
    SeededRandom a(5);
    SeededRandom b(5);

    const double n = a.Next();
    EXPECT_DOUBLE_EQ(b.Jitter(3.0), (n - 0.5) * 6.0);
}

TEST(ClonerRandom, FreshGeneratorPerIndexIsOrderIndependent)
{
    const std::int64_t seed = 1000;

    std::vector<double> forward;
    for (std::int64_t i = 0; i < 10; ++i)
        forward.push_back(SeededRandom(seed + i).Next());

    for (std::int64_t i = 9; i >= 0; --i)
        EXPECT_EQ(SeededRandom(seed + i).Next(), forward[static_cast<std::size_t>(i)]);
}
