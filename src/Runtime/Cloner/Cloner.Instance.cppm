module;

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

export module Cloner:Instance;

export namespace Cloner
{
    // One placed copy of the source object. Rotation is intrinsic XYZ Euler in
    // radians; position and scale are in scene units.
    //
    // Index is dense over the instances a generator emitted and matches list
    // position at generation time. Effectors never renumber it; index-driven
    // effectors (Random seeding, Step banding) key on it.
    struct Instance
    {
        std::string Id;
        std::uint32_t Index{0};
        glm::vec3 Position{0.0f};
        glm::vec3 Rotation{0.0f};
        glm::vec3 Scale{1.0f};
        std::optional<std::string> Color;
        bool Visible{true};

        bool operator==(const Instance&) const = default;
    };

    // "<prefix>-<index>", e.g. "grid-12".
    [[nodiscard]] inline std::string MakeInstanceId(std::string_view prefix, std::uint32_t index)
    {
        return std::format("{}-{}", prefix, index);
    }
}
