#pragma once

#include "layerkit/elevation.hpp"
#include "layerkit/instance_descriptor.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace layerkit {

    // Everything a design-time host may hand to, or ask from, a value converter.
    using Representation =
        std::variant<std::monostate, std::string, double, std::int64_t, bool, InstanceDescriptor, Elevation>;

    enum class RepresentationKind { Null, Text, Number, Integer, Boolean, Descriptor, Elevation };

    RepresentationKind kindOf(const Representation &representation);

    const char *toString(RepresentationKind kind);

} // namespace layerkit
