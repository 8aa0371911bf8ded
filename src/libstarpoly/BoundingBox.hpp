#ifndef starpoly_BoundingBox_hpp_
#define starpoly_BoundingBox_hpp_

#include "libstarpoly.h"
#include "Point.hpp"

namespace StarPoly {

// Axis aligned box in the drawing space: min is the top-left corner, y grows down.
class BoundingBoxf
{
public:
    Vec2d min;
    Vec2d max;
    bool  defined;

    BoundingBoxf() : min(Vec2d::Zero()), max(Vec2d::Zero()), defined(false) {}
    BoundingBoxf(const Vec2d &pmin, const Vec2d &pmax) :
        min(pmin), max(pmax), defined(pmin.x() < pmax.x() && pmin.y() < pmax.y()) {}

    // Rectangle given by its top-left corner and its extents, as the drawing APIs pass it.
    static BoundingBoxf from_rect(double left, double top, double width, double height)
        { return BoundingBoxf(Vec2d(left, top), Vec2d(left + width, top + height)); }

    Vec2d  size() const { return this->max - this->min; }
    double width() const { return this->max.x() - this->min.x(); }
    double height() const { return this->max.y() - this->min.y(); }
    Vec2d  center() const { return 0.5 * (this->min + this->max); }
    // Width equals height up to EPSILON.
    bool   is_square() const { return std::abs(this->width() - this->height()) < EPSILON; }
    bool   contains(const Vec2d &point) const {
        return point.x() >= this->min.x() && point.x() <= this->max.x()
            && point.y() >= this->min.y() && point.y() <= this->max.y();
    }
    bool operator==(const BoundingBoxf &rhs) const { return this->min == rhs.min && this->max == rhs.max; }
    bool operator!=(const BoundingBoxf &rhs) const { return ! (*this == rhs); }
};

inline bool empty(const BoundingBoxf &bb)
{
    return ! bb.defined || bb.min.x() >= bb.max.x() || bb.min.y() >= bb.max.y();
}

} // namespace StarPoly

#endif
