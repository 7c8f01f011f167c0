#include "layerkit/descriptor_registry.hpp"
#include "layerkit/elevation.hpp"
#include "layerkit/elevation_converter.hpp"
#include "layerkit/errors.hpp"

#include <utility>

namespace layerkit {

    void DescriptorRegistry::add(const std::string &type, Constructor construct, EmptyConstant empty) {
        entries_[type] = Entry{std::move(construct), std::move(empty)};
    }

    bool DescriptorRegistry::contains(const std::string &type) const { return entries_.find(type) != entries_.end(); }

    Representation DescriptorRegistry::materialize(const InstanceDescriptor &descriptor) const {
        auto it = entries_.find(descriptor.type);
        if (it == entries_.end()) {
            throw UnsupportedConversionError("layerkit::DescriptorRegistry::materialize(): unknown type '" +
                                             descriptor.type + "'");
        }

        if (!descriptor.isConstructor()) {
            if (!descriptor.arguments.empty()) {
                throw UnsupportedConversionError(
                    "layerkit::DescriptorRegistry::materialize(): empty constant takes no arguments");
            }
            return it->second.empty();
        }

        if (descriptor.arguments.size() != 1) {
            throw UnsupportedConversionError("layerkit::DescriptorRegistry::materialize(): constructor of '" +
                                             descriptor.type + "' takes exactly one argument, got " +
                                             std::to_string(descriptor.arguments.size()));
        }
        return it->second.construct(descriptor.arguments.front());
    }

    const DescriptorRegistry &DescriptorRegistry::defaults() {
        static const DescriptorRegistry registry = [] {
            DescriptorRegistry r;
            r.add(
                ElevationConverter::HandledTypeName,
                [](double decimal_degrees) -> Representation { return Elevation(decimal_degrees); },
                []() -> Representation { return EmptyElevation; });
            return r;
        }();
        return registry;
    }

} // namespace layerkit
