#include "layerkit/point_layer.hpp"
#include "layerkit/layer_configurator.hpp"
#include "layerkit/logging.hpp"

#include <stdexcept>

namespace layerkit {

    PointLayer::PointLayer() : PointLayer(std::make_shared<FeatureSet>(FeatureType::Point)) {}

    PointLayer::PointLayer(std::shared_ptr<FeatureSet> featureSet) : FeatureLayer(std::move(featureSet)) {
        auto config = LayerConfigurator::configure(*dataSet());
        extent_ = config.extent;
        setScheme(std::move(config.scheme));
    }

    PointCategory &PointLayer::defaultCategory() const { return symbology()->category(0); }

    std::shared_ptr<PointScheme> PointLayer::symbology() const {
        return std::dynamic_pointer_cast<PointScheme>(scheme());
    }

    void PointLayer::setSymbology(std::shared_ptr<PointScheme> scheme) {
        if (!scheme) {
            throw std::invalid_argument("layerkit::PointLayer::setSymbology(): scheme must not be null");
        }
        setScheme(std::move(scheme));
    }

    const PointSymbolizer &PointLayer::symbolizer() const { return defaultCategory().symbolizer; }

    void PointLayer::setSymbolizer(const PointSymbolizer &symbolizer) { defaultCategory().symbolizer = symbolizer; }

    PointSymbolizer PointLayer::selectionSymbolizer() const { return defaultCategory().selectionSymbolizer(); }

    void PointLayer::setSelectionSymbolizer(const PointSymbolizer &symbolizer) {
        defaultCategory().selection_symbolizer = symbolizer;
    }

    std::shared_ptr<PointLayer> PointLayer::openFile(const std::filesystem::path &path, const LayerManager &manager) {
        auto layer = std::dynamic_pointer_cast<PointLayer>(manager.openLayer(path));
        if (!layer) {
            logger()->debug("{} did not open as a point layer", path.string());
        }
        return layer;
    }

} // namespace layerkit
