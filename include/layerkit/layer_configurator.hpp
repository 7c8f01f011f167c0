#pragma once

#include "layerkit/extent.hpp"
#include "layerkit/feature_set.hpp"
#include "layerkit/point_scheme.hpp"

#include <memory>

namespace layerkit {

    struct LayerConfiguration {
        Extent extent;
        std::shared_ptr<PointScheme> scheme;
    };

    /**
     * Derives the initial state of a point layer from its feature set.
     *
     * Point, MultiPoint and Unspecified sets are accepted. The extent is a copy of the set's extent:
     * empty for no rows, padded by SinglePointPadding on each axis for a single row (a lone point has
     * no area), unpadded otherwise. Every call builds a fresh default PointScheme.
     */
    class LayerConfigurator {
      public:
        static constexpr double SinglePointPadding = 10.0;

        static bool acceptsFeatureType(FeatureType type);

        // Throws GeometryKindMismatchError for sets of any other geometry kind.
        static LayerConfiguration configure(const FeatureSet &featureSet);
    };

} // namespace layerkit
