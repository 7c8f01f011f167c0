#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace layerkit {

    /**
     * Recipe for rebuilding a value later: either "call the one-scalar constructor of `type` with
     * `arguments[0]`", or "use the well-known empty constant of `type`" (no arguments).
     *
     * A descriptor is not a value; a host replays it through a DescriptorRegistry.
     */
    struct InstanceDescriptor {
        enum class Member { Constructor, EmptyConstant };

        std::string type;
        Member member = Member::Constructor;
        std::vector<double> arguments;

        static InstanceDescriptor constructor(std::string type, double argument);
        static InstanceDescriptor emptyConstant(std::string type);

        bool isConstructor() const { return member == Member::Constructor; }

        // {"type":"layerkit.Elevation","member":"ctor","args":[45]}
        // Throws UnsupportedConversionError for an infinite or NaN argument.
        std::string toJson() const;

        // Throws FormatError when the text is not a descriptor object of the shape toJson() writes.
        static InstanceDescriptor fromJson(std::string_view text);

        bool operator==(const InstanceDescriptor &other) const = default;
    };

    std::ostream &operator<<(std::ostream &os, const InstanceDescriptor &descriptor);

} // namespace layerkit
