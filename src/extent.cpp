#include "layerkit/extent.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <type_traits>

namespace layerkit {

    Extent::Extent(double x1, double y1, double x2, double y2)
        : min_x(std::min(x1, x2)), min_y(std::min(y1, y2)), max_x(std::max(x1, x2)), max_y(std::max(y1, y2)) {}

    Extent Extent::fromPoint(const dp::Point &point) { return Extent(point.x, point.y, point.x, point.y); }

    bool Extent::isEmpty() const {
        return std::isnan(min_x) || std::isnan(min_y) || std::isnan(max_x) || std::isnan(max_y) || min_x > max_x ||
               min_y > max_y;
    }

    double Extent::width() const { return isEmpty() ? 0.0 : max_x - min_x; }

    double Extent::height() const { return isEmpty() ? 0.0 : max_y - min_y; }

    dp::Point Extent::center() const {
        if (isEmpty())
            return dp::Point{0.0, 0.0, 0.0};
        return dp::Point{(min_x + max_x) / 2.0, (min_y + max_y) / 2.0, 0.0};
    }

    void Extent::expandBy(double dx, double dy) {
        if (isEmpty())
            return;
        min_x -= dx;
        max_x += dx;
        min_y -= dy;
        max_y += dy;
        // Shrinking past the centre collapses to the centre line
        if (min_x > max_x)
            min_x = max_x = (min_x + max_x) / 2.0;
        if (min_y > max_y)
            min_y = max_y = (min_y + max_y) / 2.0;
    }

    void Extent::expandToInclude(double x, double y) {
        if (isEmpty()) {
            min_x = max_x = x;
            min_y = max_y = y;
            return;
        }
        min_x = std::min(min_x, x);
        min_y = std::min(min_y, y);
        max_x = std::max(max_x, x);
        max_y = std::max(max_y, y);
    }

    void Extent::expandToInclude(const dp::Point &point) { expandToInclude(point.x, point.y); }

    void Extent::expandToInclude(const Extent &other) {
        if (other.isEmpty())
            return;
        expandToInclude(other.min_x, other.min_y);
        expandToInclude(other.max_x, other.max_y);
    }

    bool Extent::contains(const dp::Point &point) const {
        if (isEmpty())
            return false;
        return point.x >= min_x && point.x <= max_x && point.y >= min_y && point.y <= max_y;
    }

    bool Extent::contains(const Extent &other) const {
        if (isEmpty() || other.isEmpty())
            return false;
        return other.min_x >= min_x && other.max_x <= max_x && other.min_y >= min_y && other.max_y <= max_y;
    }

    bool Extent::intersects(const Extent &other) const {
        if (isEmpty() || other.isEmpty())
            return false;
        return other.min_x <= max_x && other.max_x >= min_x && other.min_y <= max_y && other.max_y >= min_y;
    }

    bool Extent::operator==(const Extent &other) const {
        if (isEmpty() || other.isEmpty())
            return isEmpty() && other.isEmpty();
        return min_x == other.min_x && min_y == other.min_y && max_x == other.max_x && max_y == other.max_y;
    }

    Extent extentOf(const Geometry &geometry) {
        return std::visit(
            [](auto const &shape) -> Extent {
                using T = std::decay_t<decltype(shape)>;
                Extent extent;
                if constexpr (std::is_same_v<T, dp::Point>) {
                    extent.expandToInclude(shape);
                } else if constexpr (std::is_same_v<T, dp::Segment>) {
                    extent.expandToInclude(shape.start);
                    extent.expandToInclude(shape.end);
                } else if constexpr (std::is_same_v<T, std::vector<dp::Point>>) {
                    for (auto const &p : shape)
                        extent.expandToInclude(p);
                } else if constexpr (std::is_same_v<T, dp::Polygon>) {
                    for (auto const &p : shape.vertices)
                        extent.expandToInclude(p);
                }
                return extent;
            },
            geometry);
    }

    std::ostream &operator<<(std::ostream &os, const Extent &extent) {
        if (extent.isEmpty())
            return os << "Extent(empty)";
        return os << "Extent(" << extent.min_x << ", " << extent.min_y << ", " << extent.max_x << ", " << extent.max_y
                  << ")";
    }

} // namespace layerkit
