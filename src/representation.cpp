#include "layerkit/representation.hpp"

#include <type_traits>

namespace layerkit {

    RepresentationKind kindOf(const Representation &representation) {
        return std::visit(
            [](const auto &value) -> RepresentationKind {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return RepresentationKind::Null;
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return RepresentationKind::Text;
                } else if constexpr (std::is_same_v<T, double>) {
                    return RepresentationKind::Number;
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return RepresentationKind::Integer;
                } else if constexpr (std::is_same_v<T, bool>) {
                    return RepresentationKind::Boolean;
                } else if constexpr (std::is_same_v<T, InstanceDescriptor>) {
                    return RepresentationKind::Descriptor;
                } else {
                    static_assert(std::is_same_v<T, Elevation>, "unhandled representation alternative");
                    return RepresentationKind::Elevation;
                }
            },
            representation);
    }

    const char *toString(RepresentationKind kind) {
        switch (kind) {
        case RepresentationKind::Null:
            return "Null";
        case RepresentationKind::Text:
            return "Text";
        case RepresentationKind::Number:
            return "Number";
        case RepresentationKind::Integer:
            return "Integer";
        case RepresentationKind::Boolean:
            return "Boolean";
        case RepresentationKind::Descriptor:
            return "Descriptor";
        case RepresentationKind::Elevation:
            return "Elevation";
        }
        return "Unknown";
    }

} // namespace layerkit
