#include "layerkit/layer_configurator.hpp"
#include "layerkit/errors.hpp"
#include "layerkit/logging.hpp"

#include <string>

namespace layerkit {

    bool LayerConfigurator::acceptsFeatureType(FeatureType type) {
        return type == FeatureType::Point || type == FeatureType::MultiPoint || type == FeatureType::Unspecified;
    }

    LayerConfiguration LayerConfigurator::configure(const FeatureSet &featureSet) {
        const FeatureType type = featureSet.featureType();
        if (!acceptsFeatureType(type)) {
            throw GeometryKindMismatchError(std::string("layerkit::LayerConfigurator::configure(): a point layer "
                                                        "cannot be built from a ") +
                                            toString(type) + " feature set");
        }

        LayerConfiguration config;
        const std::size_t rows = featureSet.numRows();
        if (rows == 0) {
            config.extent = Extent{};
        } else if (rows == 1) {
            config.extent = featureSet.extent();
            config.extent.expandBy(SinglePointPadding, SinglePointPadding);
        } else {
            config.extent = featureSet.extent();
        }

        config.scheme = std::make_shared<PointScheme>();

        logger()->debug("configured point layer: type={} rows={} extent=[{}, {}, {}, {}]", toString(type), rows,
                        config.extent.min_x, config.extent.min_y, config.extent.max_x, config.extent.max_y);
        return config;
    }

} // namespace layerkit
