#include "layerkit/elevation_converter.hpp"
#include "layerkit/descriptor_registry.hpp"
#include "layerkit/errors.hpp"

namespace layerkit {

    namespace detail {
        inline bool is_supported(RepresentationKind kind) {
            switch (kind) {
            case RepresentationKind::Text:
            case RepresentationKind::Number:
            case RepresentationKind::Descriptor:
            case RepresentationKind::Elevation:
                return true;
            case RepresentationKind::Null:
            case RepresentationKind::Integer:
            case RepresentationKind::Boolean:
                return false;
            }
            return false;
        }

        [[noreturn]] inline void unsupported(const char *where, const char *direction, RepresentationKind kind) {
            throw UnsupportedConversionError(std::string("layerkit::ElevationConverter::") + where + "(): cannot convert " +
                                             direction + " " + toString(kind));
        }
    } // namespace detail

    bool ElevationConverter::canConvertFrom(RepresentationKind source) const { return detail::is_supported(source); }

    Elevation ElevationConverter::convertFrom(const Representation &source, const Culture &culture) const {
        const auto kind = kindOf(source);
        switch (kind) {
        case RepresentationKind::Text:
            return Elevation::parse(std::get<std::string>(source), culture);
        case RepresentationKind::Number:
            return Elevation(std::get<double>(source));
        case RepresentationKind::Elevation:
            return std::get<Elevation>(source);
        case RepresentationKind::Descriptor: {
            const auto &descriptor = std::get<InstanceDescriptor>(source);
            if (descriptor.type != HandledTypeName) {
                throw UnsupportedConversionError("layerkit::ElevationConverter::convertFrom(): descriptor for '" +
                                                 descriptor.type + "' does not build an Elevation");
            }
            auto value = DescriptorRegistry::defaults().materialize(descriptor);
            return std::get<Elevation>(value);
        }
        case RepresentationKind::Null:
        case RepresentationKind::Integer:
        case RepresentationKind::Boolean:
            break;
        }
        detail::unsupported("convertFrom", "from", kind);
    }

    bool ElevationConverter::isValid(const Representation &source, const Culture &culture) const {
        if (!canConvertFrom(kindOf(source)))
            return false;
        try {
            (void)convertFrom(source, culture);
            return true;
        } catch (const FormatError &) {
            return false;
        } catch (const UnsupportedConversionError &) {
            return false;
        }
    }

    bool ElevationConverter::canConvertTo(RepresentationKind destination) const {
        return detail::is_supported(destination);
    }

    Representation ElevationConverter::convertTo(const std::optional<Elevation> &value, RepresentationKind destination,
                                                 const Culture &culture) const {
        switch (destination) {
        case RepresentationKind::Elevation:
            return value ? *value : EmptyElevation;
        case RepresentationKind::Text:
            if (!value)
                return NullElevationText;
            return value->toString(culture);
        case RepresentationKind::Number:
            if (!value) {
                throw UnsupportedConversionError(
                    "layerkit::ElevationConverter::convertTo(): a null elevation has no Number form");
            }
            return value->decimalDegrees();
        case RepresentationKind::Descriptor:
            if (!value)
                return InstanceDescriptor::emptyConstant(HandledTypeName);
            return InstanceDescriptor::constructor(HandledTypeName, value->decimalDegrees());
        case RepresentationKind::Null:
        case RepresentationKind::Integer:
        case RepresentationKind::Boolean:
            break;
        }
        detail::unsupported("convertTo", "to", destination);
    }

    std::vector<std::string> ElevationConverter::getStandardValues() const {
        return {"Equator", "NorthPole", "SouthPole", "TropicOfCapricorn", "TropicOfCancer"};
    }

} // namespace layerkit
