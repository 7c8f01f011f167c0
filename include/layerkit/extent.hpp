#pragma once

#include "layerkit/types.hpp"

#include <iosfwd>
#include <limits>

namespace layerkit {

    // Axis-aligned XY bounding box. A default-constructed extent is empty (no bounds).
    struct Extent {
        double min_x = std::numeric_limits<double>::quiet_NaN();
        double min_y = std::numeric_limits<double>::quiet_NaN();
        double max_x = std::numeric_limits<double>::quiet_NaN();
        double max_y = std::numeric_limits<double>::quiet_NaN();

        Extent() = default;
        Extent(double x1, double y1, double x2, double y2);

        static Extent fromPoint(const dp::Point &point);

        bool isEmpty() const;

        double width() const;
        double height() const;
        dp::Point center() const;

        // Grows each side by dx / dy. An empty extent stays empty.
        void expandBy(double dx, double dy);

        void expandToInclude(double x, double y);
        void expandToInclude(const dp::Point &point);
        void expandToInclude(const Extent &other);

        bool contains(const dp::Point &point) const;
        bool contains(const Extent &other) const;
        bool intersects(const Extent &other) const;

        // Empty extents compare equal to each other regardless of how they were produced.
        bool operator==(const Extent &other) const;
        bool operator!=(const Extent &other) const { return !(*this == other); }
    };

    Extent extentOf(const Geometry &geometry);

    std::ostream &operator<<(std::ostream &os, const Extent &extent);

} // namespace layerkit
