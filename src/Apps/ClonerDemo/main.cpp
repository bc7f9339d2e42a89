#include <cstdlib>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

import Core.Error;
import Core.Logging;
import Cloner;
import ECS;

using namespace Core;

// Builds a cloner entity for the requested mode with a small effector stack,
// runs the cloner system once and prints what the renderer would receive.
int main(int argc, char** argv)
{
    const std::string_view modeName = argc > 1 ? std::string_view(argv[1]) : std::string_view("linear");

    const Expected<Cloner::Mode> mode = Cloner::ParseMode(modeName);
    if (!mode)
    {
        Log::Error("Unknown cloner mode '{}' ({})", modeName, ErrorCodeToString(mode.error()));
        Log::Error("Expected one of: linear, radial, grid, scatter, spline, object");
        return EXIT_FAILURE;
    }

    entt::registry registry;
    const entt::entity entity = registry.create();

    auto& cloner = registry.emplace<ECS::Components::Cloner::Component>(entity);
    cloner.Name = "Demo Cloner";
    cloner.SourceObjectId = "cube";
    cloner.Config = Cloner::MakeDefaultConfig(*mode, 1337);

    // Randomize position a little, then shrink everything near the origin.
    cloner.Effectors.push_back(Cloner::MakeDefaultEffector(Cloner::EffectorKind::Random, 42));
    auto falloff = std::get<Cloner::FalloffEffector>(Cloner::MakeDefaultEffector(Cloner::EffectorKind::Falloff));
    falloff.Affects.Position = false;
    falloff.Affects.Scale = true;
    falloff.Radius = 3.0f;
    cloner.Effectors.emplace_back(falloff);

    ECS::Systems::Cloner::MarkDirty(registry, entity);
    ECS::Systems::Cloner::OnUpdate(registry);

    const auto& out = registry.get<ECS::Components::Cloner::Instances>(entity);
    Log::Info("Cloner '{}' ({}): {} instances, {} visible", cloner.Name, Cloner::ModeName(*mode),
        out.Stats.TotalInstances, out.Stats.VisibleInstances);

    for (const Cloner::Instance& inst : out.Items)
    {
        Log::Info("  {:<12} pos ({:8.3f}, {:8.3f}, {:8.3f})  rot ({:6.3f}, {:6.3f}, {:6.3f})  scale ({:5.3f}, {:5.3f}, {:5.3f}){}",
            inst.Id,
            inst.Position.x, inst.Position.y, inst.Position.z,
            inst.Rotation.x, inst.Rotation.y, inst.Rotation.z,
            inst.Scale.x, inst.Scale.y, inst.Scale.z,
            inst.Visible ? "" : "  [hidden]");
    }

    if (out.Stats.PositionBounds.IsValid())
    {
        const glm::vec3 size = out.Stats.PositionBounds.GetSize();
        Log::Info("Bounds size: ({:.3f}, {:.3f}, {:.3f})", size.x, size.y, size.z);
    }
    else
    {
        Log::Warn("Cloner produced no instances");
    }

    return EXIT_SUCCESS;
}
