module;

#include <algorithm>
#include <iterator>
#include <span>
#include <vector>

#include <glm/glm.hpp>

module Cloner:Stats.Impl;

import :Stats;
import :Instance;

namespace Cloner
{
    Stats ComputeStats(std::span<const Instance> instances)
    {
        Stats stats;
        stats.TotalInstances = instances.size();

        for (const Instance& inst : instances)
        {
            if (inst.Visible)
                ++stats.VisibleInstances;
            stats.PositionBounds.Min = glm::min(stats.PositionBounds.Min, inst.Position);
            stats.PositionBounds.Max = glm::max(stats.PositionBounds.Max, inst.Position);
        }

        return stats;
    }

    std::vector<Instance> CollectVisible(std::span<const Instance> instances)
    {
        std::vector<Instance> visible;
        visible.reserve(instances.size());
        std::copy_if(instances.begin(), instances.end(), std::back_inserter(visible),
            [](const Instance& inst) { return inst.Visible; });
        return visible;
    }
}
