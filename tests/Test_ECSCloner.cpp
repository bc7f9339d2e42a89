#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>
#include <entt/entity/registry.hpp>
#include <utility>
#include <variant>
#include <vector>

import ECS;
import Cloner;

using namespace ECS;
namespace ClonerComponents = ECS::Components::Cloner;

namespace
{
    entt::entity CreateCloner(entt::registry& registry, ::Cloner::ClonerConfig config)
    {
        entt::entity e = registry.create();
        auto& cloner = registry.emplace<ClonerComponents::Component>(e);
        cloner.Name = "Cloner";
        cloner.Config = std::move(config);
        return e;
    }
}

// -----------------------------------------------------------------------------
// Cloner system
// -----------------------------------------------------------------------------

TEST(ECS_Cloner, DirtyClonerIsRebuilt)
{
    entt::registry registry;
    entt::entity e = CreateCloner(registry, ::Cloner::MakeDefaultConfig(::Cloner::Mode::Grid));
    Systems::Cloner::MarkDirty(registry, e);

    EXPECT_EQ(Systems::Cloner::OnUpdate(registry), 1u);

    ASSERT_TRUE(registry.all_of<ClonerComponents::Instances>(e));
    const auto& instances = registry.get<ClonerComponents::Instances>(e);
    EXPECT_EQ(instances.Items.size(), 9u);
    EXPECT_EQ(instances.Stats.TotalInstances, 9u);
    EXPECT_EQ(instances.Stats.VisibleInstances, 9u);
    EXPECT_FALSE(registry.all_of<ClonerComponents::IsDirtyTag>(e));
}

TEST(ECS_Cloner, CleanClonerIsLeftAlone)
{
    entt::registry registry;
    entt::entity e = CreateCloner(registry, ::Cloner::MakeDefaultConfig(::Cloner::Mode::Linear));

    EXPECT_EQ(Systems::Cloner::OnUpdate(registry), 0u);
    EXPECT_FALSE(registry.all_of<ClonerComponents::Instances>(e));
}

TEST(ECS_Cloner, EditingAndMarkingReplacesInstances)
{
    entt::registry registry;
    entt::entity e = CreateCloner(registry, ::Cloner::MakeDefaultConfig(::Cloner::Mode::Linear));
    Systems::Cloner::MarkDirty(registry, e);
    (void)Systems::Cloner::OnUpdate(registry);
    EXPECT_EQ(registry.get<ClonerComponents::Instances>(e).Items.size(), 10u);

    auto& cloner = registry.get<ClonerComponents::Component>(e);
    std::get<::Cloner::LinearConfig>(cloner.Config).Count = 3;

    // Not rebuilt until marked
    EXPECT_EQ(Systems::Cloner::OnUpdate(registry), 0u);
    EXPECT_EQ(registry.get<ClonerComponents::Instances>(e).Items.size(), 10u);

    Systems::Cloner::MarkDirty(registry, e);
    EXPECT_EQ(Systems::Cloner::OnUpdate(registry), 1u);
    EXPECT_EQ(registry.get<ClonerComponents::Instances>(e).Items.size(), 3u);
}

TEST(ECS_Cloner, DisabledClonerHasNoInstances)
{
    entt::registry registry;
    entt::entity e = CreateCloner(registry, ::Cloner::MakeDefaultConfig(::Cloner::Mode::Radial));
    registry.get<ClonerComponents::Component>(e).Enabled = false;
    Systems::Cloner::MarkDirty(registry, e);

    EXPECT_EQ(Systems::Cloner::OnUpdate(registry), 1u);
    const auto& instances = registry.get<ClonerComponents::Instances>(e);
    EXPECT_TRUE(instances.Items.empty());
    EXPECT_EQ(instances.Stats.TotalInstances, 0u);
    EXPECT_FALSE(instances.Stats.PositionBounds.IsValid());
}

TEST(ECS_Cloner, EffectorsFlowIntoStats)
{
    entt::registry registry;
    entt::entity e = CreateCloner(registry, ::Cloner::MakeDefaultConfig(::Cloner::Mode::Linear));

    ::Cloner::StepEffector step;
    step.Affects = ::Cloner::AffectsMask{false, false, false, false, true};
    registry.get<ClonerComponents::Component>(e).Effectors.push_back(step);
    Systems::Cloner::MarkDirty(registry, e);

    (void)Systems::Cloner::OnUpdate(registry);
    const auto& instances = registry.get<ClonerComponents::Instances>(e);
    EXPECT_EQ(instances.Stats.TotalInstances, 10u);
    // Indices 0,1,4,5,8,9 fall on even bands and are hidden.
    EXPECT_EQ(instances.Stats.VisibleInstances, 4u);
}

TEST(ECS_Cloner, OnlyDirtyClonersRebuild)
{
    entt::registry registry;
    std::vector<entt::entity> entities;
    for (int i = 0; i < 4; ++i)
        entities.push_back(CreateCloner(registry, ::Cloner::MakeDefaultConfig(::Cloner::Mode::Linear)));

    Systems::Cloner::MarkDirty(registry, entities[1]);
    Systems::Cloner::MarkDirty(registry, entities[3]);

    EXPECT_EQ(Systems::Cloner::OnUpdate(registry), 2u);
    EXPECT_FALSE(registry.all_of<ClonerComponents::Instances>(entities[0]));
    EXPECT_TRUE(registry.all_of<ClonerComponents::Instances>(entities[1]));
    EXPECT_FALSE(registry.all_of<ClonerComponents::Instances>(entities[2]));
    EXPECT_TRUE(registry.all_of<ClonerComponents::Instances>(entities[3]));
    EXPECT_TRUE(registry.view<ClonerComponents::IsDirtyTag>().empty());
}
