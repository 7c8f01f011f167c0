#pragma once

#include <datapod/datapod.hpp>

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dp = ::datapod;

namespace layerkit {

    // All coordinates are stored in the local (ENU) frame of the owning feature set
    using Geometry = std::variant<dp::Point, dp::Segment, std::vector<dp::Point>, dp::Polygon>;

    using Properties = std::unordered_map<std::string, std::string>;

    enum class FeatureType { Unspecified, Point, MultiPoint, Line, Polygon };

    struct Feature {
        Geometry geometry;
        Properties properties;
    };

    const char *toString(FeatureType type);

} // namespace layerkit
