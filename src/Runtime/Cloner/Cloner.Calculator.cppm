module;

#include <span>
#include <vector>

export module Cloner:Calculator;

import :Instance;
import :Config;
import :Effectors;

export namespace Cloner
{
    // Dispatches the active mode to its generator. Only the discriminator is
    // inspected; fields of other modes are never read.
    [[nodiscard]] std::vector<Instance> Calculate(const ClonerConfig& config);

    // Generator output folded through `effectors` in list order.
    [[nodiscard]] std::vector<Instance> Calculate(const ClonerConfig& config, std::span<const Effector> effectors);
}
