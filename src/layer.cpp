#include "layerkit/layer.hpp"

#include <stdexcept>

namespace layerkit {

    FeatureLayer::FeatureLayer(std::shared_ptr<FeatureSet> dataset) : dataset_(std::move(dataset)) {
        if (!dataset_) {
            throw std::invalid_argument("layerkit::FeatureLayer: feature set must not be null");
        }
    }

} // namespace layerkit
