#ifndef starpoly_Point_hpp_
#define starpoly_Point_hpp_

#include "libstarpoly.h"
#include <cstddef>
#include <vector>
#include <cmath>
#include <string>

#include <Eigen/Geometry>

namespace StarPoly {

using Vec2d   = Eigen::Matrix<double,   2, 1, Eigen::DontAlign>;

// Ordered point sequence, the order defines the path traversal order.
using Pointfs        = std::vector<Vec2d>;

template<typename Derived, typename Derived2>
inline typename Derived::Scalar cross2(const Eigen::MatrixBase<Derived> &v1, const Eigen::MatrixBase<Derived2> &v2)
{
    static_assert(std::is_same<typename Derived::Scalar, typename Derived2::Scalar>::value, "cross2(): Scalar types of 1st and 2nd operand must be equal.");
    return v1.x() * v2.y() - v1.y() * v2.x();
}

std::string to_string(const Vec2d &pt);

inline bool is_approx(const Vec2d &p1, const Vec2d &p2, double epsilon = EPSILON)
{
    Vec2d d = (p2 - p1).cwiseAbs();
    return d.x() < epsilon && d.y() < epsilon;
}

inline double distance(const Vec2d &p1, const Vec2d &p2) { return (p2 - p1).norm(); }

// Rotation by angle (radians) around center, counter-clockwise in a y-up frame.
void   rotate(Vec2d &pt, double angle, const Vec2d &center);
Vec2d  rotated(const Vec2d &pt, double angle, const Vec2d &center);

} // namespace StarPoly

#endif
