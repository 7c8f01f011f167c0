#pragma once

#include "layerkit/culture.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace layerkit {

    /**
     * Angle above the horizon, in decimal degrees.
     *
     * An Elevation is fully described by its single scalar; constructing two instances from the same
     * value gives equal objects, and Elevation(e.decimalDegrees()) == e for every e.
     */
    class Elevation {
      private:
        double decimal_degrees_ = 0.0;

      public:
        constexpr Elevation() = default;
        constexpr explicit Elevation(double decimal_degrees) : decimal_degrees_(decimal_degrees) {}

        constexpr double decimalDegrees() const { return decimal_degrees_; }

        /**
         * Parses "45", "45.5°", "45°30'", "45°30'36\"", or one of the standard value names
         * ("Equator", "NorthPole", ...). Numbers follow the culture's separators.
         * Throws FormatError when the text is not an elevation.
         */
        static Elevation parse(std::string_view text, const Culture &culture = Culture::invariant());

        // Up to 15 significant digits followed by the degree sign.
        std::string toString(const Culture &culture = Culture::invariant()) const;

        constexpr bool operator==(const Elevation &other) const { return decimal_degrees_ == other.decimal_degrees_; }
        constexpr bool operator!=(const Elevation &other) const { return !(*this == other); }
    };

    inline constexpr Elevation EmptyElevation{0.0};

    namespace elevations {
        inline constexpr Elevation Equator{0.0};
        inline constexpr Elevation NorthPole{90.0};
        inline constexpr Elevation SouthPole{-90.0};
        inline constexpr Elevation TropicOfCancer{23.5};
        inline constexpr Elevation TropicOfCapricorn{-23.5};
    } // namespace elevations

    // UTF-8 degree sign
    inline constexpr std::string_view DegreeSymbol = "\xC2\xB0";

    std::ostream &operator<<(std::ostream &os, const Elevation &elevation);

} // namespace layerkit
