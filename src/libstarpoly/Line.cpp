#include "Line.hpp"
#include <algorithm>
#include <cmath>

namespace StarPoly {

bool Linef::parallel_to(const Linef &line) const
{
    const Vec2d v1 = this->vector();
    const Vec2d v2 = line.vector();
    return sqr(cross2(v1, v2)) < sqr(EPSILON) * v1.squaredNorm() * v2.squaredNorm();
}

bool Linef::contains_strictly(const Vec2d &pt) const
{
    // The point is on the line already, thus testing the longer extent of the segment is sufficient.
    // Testing both extents would reject any point of a horizontal or vertical segment.
    const Vec2d v    = this->vector();
    const int   axis = std::abs(v.x()) >= std::abs(v.y()) ? X : Y;
    const double lo  = std::min(this->a(axis), this->b(axis));
    const double hi  = std::max(this->a(axis), this->b(axis));
    // Rounding errors would otherwise accept lines meeting at a shared end point.
    const double margin = EPSILON * (hi - lo);
    return pt(axis) > lo + margin && pt(axis) < hi - margin;
}

bool Linef::intersection_strict(const Linef &line, Vec2d *intersection) const
{
    if (this->degenerate() || line.degenerate() || this->parallel_to(line))
        return false;

    // System of two equations with two unknowns:
    // y = slope1 * x + yint1
    // y = slope2 * x + yint2
    Vec2d pt;
    if (this->vertical()) {
        double slope = line.slope();
        pt.x() = 0.5 * (this->a.x() + this->b.x());
        pt.y() = slope * pt.x() + Linef::y_intercept(line.a, slope);
    } else if (line.vertical()) {
        double slope = this->slope();
        pt.x() = 0.5 * (line.a.x() + line.b.x());
        pt.y() = slope * pt.x() + Linef::y_intercept(this->a, slope);
    } else {
        double slope1 = this->slope();
        double slope2 = line.slope();
        double yint1  = Linef::y_intercept(this->a, slope1);
        double yint2  = Linef::y_intercept(line.a, slope2);
        pt.x() = (yint2 - yint1) / (slope1 - slope2);
        pt.y() = slope1 * pt.x() + yint1;
    }

    if (! this->contains_strictly(pt) || ! line.contains_strictly(pt))
        return false;
    *intersection = pt;
    return true;
}

Linesf to_lines_closed(const Pointfs &points)
{
    Linesf lines;
    if (points.size() < 2)
        return lines;
    lines.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++ i)
        lines.emplace_back(points[i], points[(i + 1) % points.size()]);
    return lines;
}

} // namespace StarPoly
