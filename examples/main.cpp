#include "layerkit/layerkit.hpp"

#include <iostream>
#include <memory>

namespace dp = ::datapod;

int main() {
    try {
        // 1) Move an elevation through the forms a property editor uses
        lk::ElevationConverter converter;
        auto elevation = converter.convertFrom(lk::Representation{std::string("45\xC2\xB0" "30'")});
        auto text = std::get<std::string>(converter.convertTo(elevation, lk::RepresentationKind::Text));
        auto descriptor =
            std::get<lk::InstanceDescriptor>(converter.convertTo(elevation, lk::RepresentationKind::Descriptor));
        std::cout << "Elevation: " << text << "\n";
        std::cout << "Descriptor: " << descriptor << "\n";

        std::cout << "Standard values:";
        for (const auto &name : converter.getStandardValues()) {
            std::cout << " " << name;
        }
        std::cout << "\n";

        // 2) Build a point layer from a couple of surveyed positions
        auto wells = std::make_shared<lk::FeatureSet>(lk::FeatureType::Point, dp::Geo{52.0, 5.0, 0.0});
        wells->addWgsPoint(concord::earth::WGS{52.001, 5.001, 0.0}, {{"name", "north well"}});
        wells->addWgsPoint(concord::earth::WGS{51.999, 4.999, 0.0}, {{"name", "south well"}});

        lk::PointLayer layer(wells);
        std::cout << "Layer extent: " << layer.extent() << "\n";
        std::cout << "Scheme categories: " << layer.symbology()->categoryCount() << "\n";
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
