module;
#include <cstddef>
#include <entt/fwd.hpp>

export module ECS:Systems.Cloner;

export namespace ECS::Systems::Cloner
{
    // Rebuilds Instances for every cloner carrying IsDirtyTag, then clears the
    // tag. Returns the number of cloners rebuilt.
    std::size_t OnUpdate(entt::registry& registry);

    void MarkDirty(entt::registry& registry, entt::entity entity);
}
