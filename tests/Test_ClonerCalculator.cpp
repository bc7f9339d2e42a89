#include <gtest/gtest.h>
#include <cstdint>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

import Cloner;
import Core.Error;

using namespace Cloner;

// -----------------------------------------------------------------------------
// Mode metadata and defaults
// -----------------------------------------------------------------------------

TEST(ClonerConfig, ModeNamesRoundTrip)
{
    for (auto mode : {Mode::Linear, Mode::Radial, Mode::Grid, Mode::Scatter, Mode::Spline, Mode::Object})
    {
        const auto parsed = ParseMode(ModeName(mode));
        ASSERT_TRUE(parsed.has_value()) << ModeName(mode);
        EXPECT_EQ(*parsed, mode);
        EXPECT_EQ(GetMode(MakeDefaultConfig(mode)), mode);
    }

    const auto bad = ParseMode("fractal");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), Core::ErrorCode::InvalidArgument);
}

TEST(ClonerConfig, PlaneAndAxisNames)
{
    EXPECT_EQ(ParsePlane("xy").value(), Plane::XY);
    EXPECT_EQ(ParsePlane("yz").value(), Plane::YZ);
    EXPECT_FALSE(ParsePlane("zx").has_value());

    EXPECT_EQ(ParseAxis("z").value(), Axis::Z);
    EXPECT_FALSE(ParseAxis("w").has_value());
}

TEST(ClonerConfig, EditorDefaults)
{
    const auto linear = std::get<LinearConfig>(MakeDefaultConfig(Mode::Linear));
    EXPECT_EQ(linear.Count, 10u);
    EXPECT_FLOAT_EQ(linear.Spacing, 1.0f);
    EXPECT_EQ(linear.Direction, LinearDirection::X);

    const auto radial = std::get<RadialConfig>(MakeDefaultConfig(Mode::Radial));
    EXPECT_EQ(radial.Count, 8u);
    EXPECT_FLOAT_EQ(radial.Radius, 2.0f);
    EXPECT_EQ(radial.ArcPlane, Plane::XZ);
    EXPECT_TRUE(radial.AlignToRadius);

    const auto grid = std::get<GridConfig>(MakeDefaultConfig(Mode::Grid));
    EXPECT_EQ(grid.CountX * grid.CountY * grid.CountZ, 9u);
    EXPECT_TRUE(grid.Centered);

    const auto scatter = std::get<ScatterConfig>(MakeDefaultConfig(Mode::Scatter, 99));
    EXPECT_EQ(scatter.Count, 50u);
    EXPECT_EQ(scatter.Seed, 99);
    ASSERT_TRUE(scatter.Box.has_value());
    EXPECT_FLOAT_EQ(scatter.Box->Min.y, 0.0f);
    EXPECT_FLOAT_EQ(scatter.Box->Max.y, 0.0f);

    const auto spline = std::get<SplineConfig>(MakeDefaultConfig(Mode::Spline));
    EXPECT_EQ(spline.Count, 20u);
    EXPECT_EQ(spline.Points.size(), 4u);
    EXPECT_EQ(spline.Type, Spline::CurveType::CatmullRom);
}

// -----------------------------------------------------------------------------
// Calculate
// -----------------------------------------------------------------------------

TEST(ClonerCalculate, DispatchesToActiveMode)
{
    EXPECT_EQ(Calculate(MakeDefaultConfig(Mode::Linear)).size(), 10u);
    EXPECT_EQ(Calculate(MakeDefaultConfig(Mode::Radial)).size(), 8u);
    EXPECT_EQ(Calculate(MakeDefaultConfig(Mode::Grid)).size(), 9u);
    EXPECT_EQ(Calculate(MakeDefaultConfig(Mode::Scatter)).size(), 50u);
    EXPECT_EQ(Calculate(MakeDefaultConfig(Mode::Spline)).size(), 20u);
    EXPECT_TRUE(Calculate(MakeDefaultConfig(Mode::Object)).empty());

    const auto radial = Calculate(MakeDefaultConfig(Mode::Radial));
    EXPECT_EQ(radial.front().Id, "radial-0");
}

TEST(ClonerCalculate, MatchesDirectGenerator)
{
    LinearConfig config;
    config.Count = 4;
    config.Spacing = 3.0f;
    EXPECT_EQ(Calculate(ClonerConfig{config}), Generators::GenerateLinear(config));
}

TEST(ClonerCalculate, RepeatableForSameConfig)
{
    const ClonerConfig config = MakeDefaultConfig(Mode::Scatter, 2024);
    const std::vector<Effector> effectors{
        MakeDefaultEffector(EffectorKind::Random, 5),
        MakeDefaultEffector(EffectorKind::Noise),
    };

    EXPECT_EQ(Calculate(config, effectors), Calculate(config, effectors));
}

TEST(ClonerCalculate, AppliesEffectorsAfterGeneration)
{
    const ClonerConfig config = MakeDefaultConfig(Mode::Linear);

    StepEffector step;
    step.Affects = AffectsMask{false, false, false, false, true};
    const std::vector<Effector> effectors{step};

    const auto plain = Calculate(config, {});
    EXPECT_EQ(plain, Calculate(config));

    const auto stepped = Calculate(config, effectors);
    ASSERT_EQ(stepped.size(), plain.size());
    EXPECT_FALSE(stepped[0].Visible);
    EXPECT_TRUE(stepped[2].Visible);
    EXPECT_EQ(stepped[0].Position, plain[0].Position);
}

// -----------------------------------------------------------------------------
// Stats
// -----------------------------------------------------------------------------

TEST(ClonerStats, EmptyListHasInvalidBounds)
{
    const Stats stats = ComputeStats({});
    EXPECT_EQ(stats.TotalInstances, 0u);
    EXPECT_EQ(stats.VisibleInstances, 0u);
    EXPECT_FALSE(stats.PositionBounds.IsValid());
}

TEST(ClonerStats, CountsAndBounds)
{
    GridConfig config;
    config.CountX = 3;
    config.CountY = 2;
    config.CountZ = 2;
    config.SpacingX = 2.0f;

    auto instances = Calculate(ClonerConfig{config});
    instances[1].Visible = false;
    instances[4].Visible = false;

    const Stats stats = ComputeStats(instances);
    EXPECT_EQ(stats.TotalInstances, 12u);
    EXPECT_EQ(stats.VisibleInstances, 10u);
    ASSERT_TRUE(stats.PositionBounds.IsValid());
    EXPECT_EQ(stats.PositionBounds.Min, glm::vec3(-2.0f, -0.5f, -0.5f));
    EXPECT_EQ(stats.PositionBounds.Max, glm::vec3(2.0f, 0.5f, 0.5f));
    EXPECT_EQ(stats.PositionBounds.GetCenter(), glm::vec3(0.0f));
    EXPECT_EQ(stats.PositionBounds.GetSize(), glm::vec3(4.0f, 1.0f, 1.0f));
}

TEST(ClonerStats, CollectVisibleKeepsOrder)
{
    auto instances = Calculate(MakeDefaultConfig(Mode::Linear));
    for (auto& inst : instances)
        inst.Visible = inst.Index % 3 == 0;

    const auto visible = CollectVisible(instances);
    ASSERT_EQ(visible.size(), 4u);
    EXPECT_EQ(visible[0].Index, 0u);
    EXPECT_EQ(visible[1].Index, 3u);
    EXPECT_EQ(visible[2].Index, 6u);
    EXPECT_EQ(visible[3].Index, 9u);
}
