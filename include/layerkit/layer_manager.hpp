#pragma once

#include "layerkit/layer.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace layerkit {

    // Knows how to turn some kind of data source into a layer.
    class LayerProvider {
      public:
        virtual ~LayerProvider() = default;

        virtual std::string name() const = 0;
        virtual bool canOpen(const std::filesystem::path &path) const = 0;
        virtual std::shared_ptr<FeatureLayer> open(const std::filesystem::path &path) const = 0;
    };

    class LayerManager {
      private:
        std::vector<std::shared_ptr<LayerProvider>> providers_;

      public:
        void addProvider(std::shared_ptr<LayerProvider> provider);
        std::size_t providerCount() const { return providers_.size(); }

        // Asks providers in registration order. Throws std::runtime_error when none can open the path.
        std::shared_ptr<FeatureLayer> openLayer(const std::filesystem::path &path) const;
    };

} // namespace layerkit
