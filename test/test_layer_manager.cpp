#include <doctest/doctest.h>

#include "layerkit/layerkit.hpp"

#include <memory>
#include <string>

namespace dp = ::datapod;

namespace {

    // Test layer kind that is not a point layer.
    class LineLayer : public lk::FeatureLayer {
      public:
        explicit LineLayer(std::shared_ptr<lk::FeatureSet> set) : lk::FeatureLayer(std::move(set)) {}
    };

    // Serves layers by file extension from memory.
    class MemoryProvider : public lk::LayerProvider {
      private:
        std::string extension_;
        bool points_;

      public:
        MemoryProvider(std::string extension, bool points) : extension_(std::move(extension)), points_(points) {}

        std::string name() const override { return "memory" + extension_; }

        bool canOpen(const std::filesystem::path &path) const override { return path.extension() == extension_; }

        std::shared_ptr<lk::FeatureLayer> open(const std::filesystem::path &path) const override {
            if (points_) {
                auto set = std::make_shared<lk::FeatureSet>(lk::FeatureType::Point);
                set->addPoint(dp::Point{1.0, 1.0, 0.0});
                auto layer = std::make_shared<lk::PointLayer>(set);
                layer->setName(path.stem().string());
                return layer;
            }
            auto set = std::make_shared<lk::FeatureSet>(lk::FeatureType::Line);
            return std::make_shared<LineLayer>(set);
        }
    };

} // namespace

TEST_CASE("LayerManager - Opening layers") {
    lk::LayerManager manager;
    manager.addProvider(std::make_shared<MemoryProvider>(".pts", true));
    manager.addProvider(std::make_shared<MemoryProvider>(".lns", false));
    CHECK(manager.providerCount() == 2);

    SUBCASE("Provider chosen by path") {
        auto layer = manager.openLayer("wells.pts");
        REQUIRE(layer != nullptr);
        CHECK(layer->name() == "wells");
        CHECK(manager.openLayer("roads.lns") != nullptr);
    }

    SUBCASE("No provider for the path") {
        CHECK_THROWS_AS(manager.openLayer("unknown.xyz"), std::runtime_error);
    }

    SUBCASE("Point layers come back narrowed") {
        auto layer = lk::PointLayer::openFile("wells.pts", manager);
        REQUIRE(layer != nullptr);
        CHECK(layer->extent() == lk::Extent(-9.0, -9.0, 11.0, 11.0));
    }

    SUBCASE("Other layer kinds give nullptr") { CHECK(lk::PointLayer::openFile("roads.lns", manager) == nullptr); }

    SUBCASE("Null provider") { CHECK_THROWS_AS(manager.addProvider(nullptr), std::invalid_argument); }
}
