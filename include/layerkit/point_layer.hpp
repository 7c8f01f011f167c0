#pragma once

#include "layerkit/layer.hpp"
#include "layerkit/layer_manager.hpp"
#include "layerkit/point_scheme.hpp"

#include <filesystem>
#include <memory>

namespace layerkit {

    class PointLayer : public FeatureLayer {
      private:
        PointCategory &defaultCategory() const;

      public:
        // Empty layer over a new Point feature set.
        PointLayer();

        // Throws GeometryKindMismatchError unless the set holds points, multipoints or nothing typed yet.
        explicit PointLayer(std::shared_ptr<FeatureSet> featureSet);

        std::shared_ptr<PointScheme> symbology() const;
        // Throws std::invalid_argument on nullptr.
        void setSymbology(std::shared_ptr<PointScheme> scheme);

        // The symbolizers read and write the first category of the installed scheme, so they follow
        // setSymbology(). Throws std::out_of_range when that scheme has no categories.
        const PointSymbolizer &symbolizer() const;
        void setSymbolizer(const PointSymbolizer &symbolizer);

        PointSymbolizer selectionSymbolizer() const;
        void setSelectionSymbolizer(const PointSymbolizer &symbolizer);

        // Opens the file through the manager; nullptr when the opened layer is not a point layer.
        static std::shared_ptr<PointLayer> openFile(const std::filesystem::path &path, const LayerManager &manager);
    };

} // namespace layerkit
