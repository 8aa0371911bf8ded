#include "Point.hpp"

#include <locale>
#include <sstream>

namespace StarPoly {

std::string to_string(const Vec2d &pt)
{
    std::ostringstream ss;
    // Decimal point regardless of the global locale.
    ss.imbue(std::locale::classic());
    ss << "[" << pt.x() << ", " << pt.y() << "]";
    return ss.str();
}

void rotate(Vec2d &pt, double angle, const Vec2d &center)
{
    double s = std::sin(angle);
    double c = std::cos(angle);
    Vec2d  d = pt - center;
    pt.x() = center.x() + c * d.x() - s * d.y();
    pt.y() = center.y() + s * d.x() + c * d.y();
}

Vec2d rotated(const Vec2d &pt, double angle, const Vec2d &center)
{
    Vec2d res(pt);
    rotate(res, angle, center);
    return res;
}

} // namespace StarPoly
