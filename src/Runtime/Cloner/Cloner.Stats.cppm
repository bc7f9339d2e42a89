module;

#include <cfloat>
#include <cstddef>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Cloner:Stats;

import :Instance;

export namespace Cloner
{
    struct Bounds
    {
        glm::vec3 Min = glm::vec3(FLT_MAX);
        glm::vec3 Max = glm::vec3(-FLT_MAX);

        [[nodiscard]] bool IsValid() const
        {
            return (Min.x <= Max.x) && (Min.y <= Max.y) && (Min.z <= Max.z);
        }

        [[nodiscard]] glm::vec3 GetCenter() const
        {
            return (Min + Max) * 0.5f;
        }

        [[nodiscard]] glm::vec3 GetSize() const
        {
            return Max - Min;
        }
    };

    struct Stats
    {
        std::size_t TotalInstances{0};
        std::size_t VisibleInstances{0};
        // Over all instance positions, hidden ones included. Invalid when empty.
        Bounds PositionBounds{};
    };

    [[nodiscard]] Stats ComputeStats(std::span<const Instance> instances);

    // Visible instances in list order, i.e. what an instanced draw uploads.
    [[nodiscard]] std::vector<Instance> CollectVisible(std::span<const Instance> instances);
}
