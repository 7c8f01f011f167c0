#include "layerkit/point_scheme.hpp"

#include <stdexcept>

namespace layerkit {

    PointSymbolizer PointSymbolizer::selected() const {
        PointSymbolizer out = *this;
        out.fill = SelectionColor;
        return out;
    }

    PointScheme::PointScheme() {
        PointCategory category;
        category.legend_text = "All Points";
        category.symbolizer.fill = Color{32, 96, 192, 255};
        categories_.push_back(category);
    }

    const PointCategory &PointScheme::category(std::size_t index) const {
        if (index >= categories_.size())
            throw std::out_of_range("Category index out of range");
        return categories_[index];
    }

    PointCategory &PointScheme::category(std::size_t index) {
        if (index >= categories_.size())
            throw std::out_of_range("Category index out of range");
        return categories_[index];
    }

    void PointScheme::addCategory(const PointCategory &category) { categories_.push_back(category); }

} // namespace layerkit
