#pragma once

#include <stdexcept>
#include <string>

namespace layerkit {

    // Text could not be parsed as the scalar of a value type under the given culture.
    class FormatError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // A conversion to or from a representation kind outside the supported set.
    class UnsupportedConversionError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // A feature set's geometry kind does not fit the layer (or feature) it was given to.
    class GeometryKindMismatchError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

} // namespace layerkit
