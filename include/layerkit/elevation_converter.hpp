#pragma once

#include "layerkit/culture.hpp"
#include "layerkit/elevation.hpp"
#include "layerkit/representation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace layerkit {

    /**
     * Converts Elevation values to and from text, numbers and instance descriptors for hosts that
     * edit and persist properties without knowing the value type at compile time.
     *
     * Stateless; one instance may be shared by any number of callers.
     */
    class ElevationConverter {
      public:
        static constexpr const char *HandledTypeName = "layerkit.Elevation";

        const char *handledTypeName() const { return HandledTypeName; }

        bool canConvertFrom(RepresentationKind source) const;

        // Throws FormatError for unparseable text and UnsupportedConversionError for other kinds.
        Elevation convertFrom(const Representation &source, const Culture &culture = Culture::invariant()) const;

        bool isValid(const Representation &source, const Culture &culture = Culture::invariant()) const;

        bool canConvertTo(RepresentationKind destination) const;

        // An empty optional stands for a null value.
        Representation convertTo(const std::optional<Elevation> &value, RepresentationKind destination,
                                 const Culture &culture = Culture::invariant()) const;

        bool getStandardValuesSupported() const { return true; }
        std::vector<std::string> getStandardValues() const;
        bool getStandardValuesExclusive() const { return false; }
    };

    // Text returned for a null value: a zero elevation.
    inline const std::string NullElevationText = "0\xC2\xB0";

} // namespace layerkit
