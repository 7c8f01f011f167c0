#pragma once

#include "layerkit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace layerkit {

    struct Color {
        std::uint8_t r = 0;
        std::uint8_t g = 0;
        std::uint8_t b = 0;
        std::uint8_t a = 255;

        bool operator==(const Color &other) const = default;
    };

    enum class PointShape { Ellipse, Rectangle, Triangle, Diamond, Hexagon, Star };

    struct PointSymbolizer {
        PointShape shape = PointShape::Ellipse;
        double size = 4.0;
        Color fill{};
        Color outline{0, 0, 0, 255};
        double outline_width = 1.0;

        // Same symbol drawn in the selection colour.
        PointSymbolizer selected() const;

        bool operator==(const PointSymbolizer &other) const = default;
    };

    inline constexpr Color SelectionColor{0, 255, 255, 255};

    struct PointCategory {
        std::string legend_text;
        std::string filter_expression;
        PointSymbolizer symbolizer;
        // Unset means the symbolizer drawn in the selection colour.
        std::optional<PointSymbolizer> selection_symbolizer;

        PointSymbolizer selectionSymbolizer() const {
            return selection_symbolizer ? *selection_symbolizer : symbolizer.selected();
        }
    };

    // Rendering scheme installed on a feature layer.
    class FeatureScheme {
      public:
        virtual ~FeatureScheme() = default;

        virtual FeatureType geometryFamily() const = 0;
        virtual std::size_t categoryCount() const = 0;
    };

    class PointScheme : public FeatureScheme {
      private:
        std::vector<PointCategory> categories_;

      public:
        // One catch-all category drawn with a default symbol.
        PointScheme();

        FeatureType geometryFamily() const override { return FeatureType::Point; }
        std::size_t categoryCount() const override { return categories_.size(); }

        const std::vector<PointCategory> &categories() const { return categories_; }
        const PointCategory &category(std::size_t index) const;
        PointCategory &category(std::size_t index);

        void addCategory(const PointCategory &category);
        void clearCategories() { categories_.clear(); }
    };

} // namespace layerkit
