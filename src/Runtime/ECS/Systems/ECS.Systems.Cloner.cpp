module;
#include <cstddef>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>

module ECS:Systems.Cloner.Impl;
import :Systems.Cloner;
import :Components.Cloner;
import Cloner;
import Core.Logging;

namespace ECS::Systems::Cloner
{
    std::size_t OnUpdate(entt::registry& registry)
    {
        std::vector<entt::entity> rebuilt;

        auto view = registry.view<Components::Cloner::Component, Components::Cloner::IsDirtyTag>();
        for (auto [entity, cloner] : view.each())
        {
            Components::Cloner::Instances out;
            if (cloner.Enabled)
                out.Items = ::Cloner::Calculate(cloner.Config, cloner.Effectors);
            out.Stats = ::Cloner::ComputeStats(out.Items);

            Core::Log::Debug("Cloner '{}' ({}) rebuilt: {} instances, {} visible", cloner.Name,
                ::Cloner::ModeName(::Cloner::GetMode(cloner.Config)), out.Stats.TotalInstances,
                out.Stats.VisibleInstances);

            registry.emplace_or_replace<Components::Cloner::Instances>(entity, std::move(out));
            rebuilt.push_back(entity);
        }

        // Tags are cleared after iteration so the view is not invalidated.
        registry.remove<Components::Cloner::IsDirtyTag>(rebuilt.begin(), rebuilt.end());
        return rebuilt.size();
    }

    void MarkDirty(entt::registry& registry, entt::entity entity)
    {
        registry.emplace_or_replace<Components::Cloner::IsDirtyTag>(entity);
    }
}
