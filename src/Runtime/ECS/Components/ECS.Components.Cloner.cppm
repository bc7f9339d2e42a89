module;
#include <string>
#include <vector>

export module ECS:Components.Cloner;

import Cloner;

export namespace ECS::Components::Cloner
{
    // Authoring data for one cloner in the scene. The source object is only
    // referenced by id; the renderer resolves it.
    struct Component
    {
        std::string Name;
        std::string SourceObjectId;
        ::Cloner::ClonerConfig Config{::Cloner::LinearConfig{}};
        std::vector<::Cloner::Effector> Effectors;
        bool Enabled{true};
        bool UseInstancing{true};
    };

    // Generated instance list, rebuilt by the cloner system.
    // Empty while the cloner is disabled.
    struct Instances
    {
        std::vector<::Cloner::Instance> Items;
        ::Cloner::Stats Stats;
    };

    // Tag component for regeneration - zero size, just marks entity
    // Usage: registry.emplace_or_replace<IsDirtyTag>(entity) after editing Component
    struct IsDirtyTag
    {
    };
}
