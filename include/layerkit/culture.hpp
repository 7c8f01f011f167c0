#pragma once

#include <locale>
#include <string>

namespace layerkit {

    // Numeric formatting conventions used when moving values to and from text.
    struct Culture {
        std::string name;
        char decimal_separator = '.';
        char group_separator = ',';

        static Culture invariant();

        // Reads the separators from the locale's numpunct facet.
        static Culture fromLocale(const std::locale &locale);
    };

} // namespace layerkit
