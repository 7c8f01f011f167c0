#include "layerkit/culture.hpp"

namespace layerkit {

    Culture Culture::invariant() { return Culture{"invariant", '.', ','}; }

    Culture Culture::fromLocale(const std::locale &locale) {
        const auto &punct = std::use_facet<std::numpunct<char>>(locale);
        Culture culture;
        culture.name = locale.name();
        culture.decimal_separator = punct.decimal_point();
        culture.group_separator = punct.thousands_sep();
        return culture;
    }

} // namespace layerkit
