#include "layerkit/layer_manager.hpp"
#include "layerkit/logging.hpp"

#include <stdexcept>
#include <utility>

namespace layerkit {

    void LayerManager::addProvider(std::shared_ptr<LayerProvider> provider) {
        if (!provider) {
            throw std::invalid_argument("layerkit::LayerManager::addProvider(): provider must not be null");
        }
        logger()->debug("registered layer provider '{}'", provider->name());
        providers_.push_back(std::move(provider));
    }

    std::shared_ptr<FeatureLayer> LayerManager::openLayer(const std::filesystem::path &path) const {
        for (const auto &provider : providers_) {
            if (provider->canOpen(path)) {
                logger()->debug("opening {} with provider '{}'", path.string(), provider->name());
                return provider->open(path);
            }
        }
        throw std::runtime_error("layerkit::LayerManager::openLayer(): no provider can open \"" + path.string() +
                                 '\"');
    }

} // namespace layerkit
