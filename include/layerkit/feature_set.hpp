#pragma once

#include "layerkit/extent.hpp"
#include "layerkit/types.hpp"

#include <concord/concord.hpp>

#include <cstddef>
#include <vector>

namespace layerkit {

    /**
     * A collection of features sharing one geometry kind.
     *
     * Coordinates live in the local ENU frame anchored at `datum`. A set created as Unspecified
     * takes the geometry kind of the first feature added to it. The extent is kept up to date on
     * every mutation and handed out by reference; callers that need a snapshot copy it.
     */
    class FeatureSet {
      private:
        FeatureType feature_type_;
        dp::Geo datum_;
        std::vector<Feature> features_;
        Extent extent_;

        void insert(const Geometry &geometry, const Properties &properties, FeatureType family);
        void updateExtent();

      public:
        explicit FeatureSet(FeatureType type = FeatureType::Unspecified,
                            const dp::Geo &datum = dp::Geo{0.001, 0.001, 1.0});

        FeatureType featureType() const { return feature_type_; }
        const dp::Geo &datum() const { return datum_; }

        std::size_t numRows() const { return features_.size(); }
        bool empty() const { return features_.empty(); }

        const Extent &extent() const { return extent_; }

        // Throws GeometryKindMismatchError when the geometry does not fit featureType(). On an Unspecified
        // set a point list is taken as a MultiPoint, the same as addMultiPoint(); Line sets still accept
        // point lists as polylines.
        void addFeature(const Geometry &geometry, const Properties &properties = {});

        void addPoint(const dp::Point &point, const Properties &properties = {});
        void addWgsPoint(const concord::earth::WGS &wgs, const Properties &properties = {});
        void addMultiPoint(const std::vector<dp::Point> &points, const Properties &properties = {});
        void addLine(const dp::Segment &line, const Properties &properties = {});
        void addPolygon(const dp::Polygon &polygon, const Properties &properties = {});

        const Feature &getFeature(std::size_t index) const;

        // An index past the end is ignored, unlike getFeature().
        void removeFeature(std::size_t index);
        void clear();

        auto begin() const { return features_.begin(); }
        auto end() const { return features_.end(); }
    };

} // namespace layerkit
