#pragma once

#include "layerkit/extent.hpp"
#include "layerkit/feature_set.hpp"
#include "layerkit/point_scheme.hpp"

#include <memory>
#include <string>
#include <utility>

namespace layerkit {

    // A map layer drawing one shared FeatureSet with one rendering scheme.
    class FeatureLayer {
      private:
        std::shared_ptr<FeatureSet> dataset_;
        std::shared_ptr<FeatureScheme> scheme_;
        std::string name_;

      protected:
        Extent extent_;

        explicit FeatureLayer(std::shared_ptr<FeatureSet> dataset);

        void setScheme(std::shared_ptr<FeatureScheme> scheme) { scheme_ = std::move(scheme); }

      public:
        virtual ~FeatureLayer() = default;

        FeatureLayer(const FeatureLayer &) = delete;
        FeatureLayer &operator=(const FeatureLayer &) = delete;

        const std::shared_ptr<FeatureSet> &dataSet() const { return dataset_; }

        const std::shared_ptr<FeatureScheme> &scheme() const { return scheme_; }

        const Extent &extent() const { return extent_; }
        void setExtent(const Extent &extent) { extent_ = extent; }

        const std::string &name() const { return name_; }
        void setName(const std::string &name) { name_ = name; }
    };

} // namespace layerkit
