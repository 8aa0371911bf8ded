#ifndef starpoly_Line_hpp_
#define starpoly_Line_hpp_

#include "libstarpoly.h"
#include "Point.hpp"

namespace StarPoly {

class Linef;
using Linesf = std::vector<Linef>;

class Linef
{
public:
    Linef() : a(Vec2d::Zero()), b(Vec2d::Zero()) {}
    Linef(const Vec2d& _a, const Vec2d& _b) : a(_a), b(_b) {}

    Vec2d   vector() const { return this->b - this->a; }
    bool    degenerate() const { return this->vector().squaredNorm() < sqr(EPSILON); }

    // Rise over run. Infinite for a vertical line, NaN for a degenerate one.
    double  slope() const { return (this->b.y() - this->a.y()) / (this->b.x() - this->a.x()); }
    // Y coordinate where the infinite line crosses x = 0.
    double  y_intercept() const { return y_intercept(this->a, this->slope()); }
    static double y_intercept(const Vec2d &pt, double slope) { return pt.y() - slope * pt.x(); }
    // The run is too short against the rise to compute a usable slope.
    bool    vertical() const { return std::abs(this->b.x() - this->a.x()) <= EPSILON * std::abs(this->b.y() - this->a.y()); }
    bool    parallel_to(const Linef &line) const;
    // pt is expected to lie on the infinite line. True if it lies inside the segment,
    // with the end points and their close neighborhood excluded.
    bool    contains_strictly(const Vec2d &pt) const;
    // Intersection of the two segments in their interiors, solved in the slope / y-intercept form.
    // Returns false for parallel or degenerate segments, or if the lines cross outside of either segment.
    bool    intersection_strict(const Linef &line, Vec2d *intersection) const;

    bool operator==(const Linef &rhs) const { return this->a == rhs.a && this->b == rhs.b; }

    Vec2d a;
    Vec2d b;
};

// Closed polyline through the points: line i connects point i with point i + 1, the last one wraps around.
Linesf to_lines_closed(const Pointfs &points);

} // namespace StarPoly

#endif // starpoly_Line_hpp_
