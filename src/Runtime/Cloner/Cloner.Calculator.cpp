module;

#include <span>
#include <variant>
#include <vector>

module Cloner:Calculator.Impl;

import :Calculator;
import :Instance;
import :Config;
import :Effectors;
import :Generators;

namespace Cloner
{
    namespace
    {
        template<class... Ts>
        struct Overloaded : Ts... { using Ts::operator()...; };
    }

    std::vector<Instance> Calculate(const ClonerConfig& config)
    {
        return std::visit(Overloaded{
            [](const LinearConfig& c)  { return Generators::GenerateLinear(c); },
            [](const RadialConfig& c)  { return Generators::GenerateRadial(c); },
            [](const GridConfig& c)    { return Generators::GenerateGrid(c); },
            [](const ScatterConfig& c) { return Generators::GenerateScatter(c); },
            [](const SplineConfig& c)  { return Generators::GenerateSpline(c); },
            [](const ObjectConfig& c)  { return Generators::GenerateObject(c); },
        }, config);
    }

    std::vector<Instance> Calculate(const ClonerConfig& config, std::span<const Effector> effectors)
    {
        std::vector<Instance> instances = Calculate(config);
        if (effectors.empty())
            return instances;
        return ApplyEffectors(instances, effectors);
    }
}
