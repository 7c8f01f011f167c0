#include "layerkit/feature_set.hpp"
#include "layerkit/errors.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>

namespace layerkit {

    const char *toString(FeatureType type) {
        switch (type) {
        case FeatureType::Unspecified:
            return "Unspecified";
        case FeatureType::Point:
            return "Point";
        case FeatureType::MultiPoint:
            return "MultiPoint";
        case FeatureType::Line:
            return "Line";
        case FeatureType::Polygon:
            return "Polygon";
        }
        return "Unknown";
    }

    namespace detail {
        inline FeatureType family_of(const Geometry &geometry) {
            return std::visit(
                [](auto const &shape) -> FeatureType {
                    using T = std::decay_t<decltype(shape)>;
                    if constexpr (std::is_same_v<T, dp::Point>) {
                        return FeatureType::Point;
                    } else if constexpr (std::is_same_v<T, std::vector<dp::Point>>) {
                        return FeatureType::MultiPoint;
                    } else if constexpr (std::is_same_v<T, dp::Polygon>) {
                        return FeatureType::Polygon;
                    } else {
                        return FeatureType::Line;
                    }
                },
                geometry);
        }

        inline bool fits(FeatureType type, const Geometry &geometry) {
            switch (type) {
            case FeatureType::Point:
                return std::holds_alternative<dp::Point>(geometry);
            case FeatureType::MultiPoint:
                return std::holds_alternative<dp::Point>(geometry) ||
                       std::holds_alternative<std::vector<dp::Point>>(geometry);
            case FeatureType::Line:
                return std::holds_alternative<dp::Segment>(geometry) ||
                       std::holds_alternative<std::vector<dp::Point>>(geometry);
            case FeatureType::Polygon:
                return std::holds_alternative<dp::Polygon>(geometry);
            case FeatureType::Unspecified:
                return true;
            }
            return false;
        }
    } // namespace detail

    FeatureSet::FeatureSet(FeatureType type, const dp::Geo &datum) : feature_type_(type), datum_(datum) {}

    void FeatureSet::insert(const Geometry &geometry, const Properties &properties, FeatureType family) {
        FeatureType target = feature_type_ == FeatureType::Unspecified ? family : feature_type_;
        if (!detail::fits(target, geometry)) {
            throw GeometryKindMismatchError(std::string("layerkit::FeatureSet::addFeature(): ") +
                                            toString(detail::family_of(geometry)) + " geometry does not fit a " +
                                            toString(target) + " feature set");
        }
        feature_type_ = target;
        features_.emplace_back(Feature{geometry, properties});
        extent_.expandToInclude(extentOf(geometry));
    }

    void FeatureSet::updateExtent() {
        extent_ = Extent{};
        for (const auto &feature : features_) {
            extent_.expandToInclude(extentOf(feature.geometry));
        }
    }

    void FeatureSet::addFeature(const Geometry &geometry, const Properties &properties) {
        insert(geometry, properties, detail::family_of(geometry));
    }

    void FeatureSet::addPoint(const dp::Point &point, const Properties &properties) {
        insert(point, properties, FeatureType::Point);
    }

    void FeatureSet::addWgsPoint(const concord::earth::WGS &wgs, const Properties &properties) {
        auto enu = concord::frame::to_enu(datum_, wgs);
        addPoint(dp::Point{enu.east(), enu.north(), enu.up()}, properties);
    }

    void FeatureSet::addMultiPoint(const std::vector<dp::Point> &points, const Properties &properties) {
        insert(points, properties, FeatureType::MultiPoint);
    }

    void FeatureSet::addLine(const dp::Segment &line, const Properties &properties) {
        insert(line, properties, FeatureType::Line);
    }

    void FeatureSet::addPolygon(const dp::Polygon &polygon, const Properties &properties) {
        insert(polygon, properties, FeatureType::Polygon);
    }

    const Feature &FeatureSet::getFeature(std::size_t index) const {
        if (index >= features_.size())
            throw std::out_of_range("Feature index out of range");
        return features_[index];
    }

    void FeatureSet::removeFeature(std::size_t index) {
        if (index < features_.size()) {
            features_.erase(features_.begin() + static_cast<std::ptrdiff_t>(index));
            updateExtent();
        }
    }

    void FeatureSet::clear() {
        features_.clear();
        extent_ = Extent{};
    }

} // namespace layerkit
