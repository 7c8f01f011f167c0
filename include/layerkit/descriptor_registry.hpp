#pragma once

#include "layerkit/instance_descriptor.hpp"
#include "layerkit/representation.hpp"

#include <functional>
#include <string>
#include <unordered_map>

namespace layerkit {

    // Maps descriptor type tags to the functions that rebuild values of that type.
    class DescriptorRegistry {
      public:
        using Constructor = std::function<Representation(double)>;
        using EmptyConstant = std::function<Representation()>;

      private:
        struct Entry {
            Constructor construct;
            EmptyConstant empty;
        };

        std::unordered_map<std::string, Entry> entries_;

      public:
        void add(const std::string &type, Constructor construct, EmptyConstant empty);

        bool contains(const std::string &type) const;

        // Throws UnsupportedConversionError for unknown tags or a constructor call without exactly one argument.
        Representation materialize(const InstanceDescriptor &descriptor) const;

        // Immutable registry with every value type layerkit converts (currently Elevation).
        static const DescriptorRegistry &defaults();
    };

} // namespace layerkit
