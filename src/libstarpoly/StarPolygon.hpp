#ifndef starpoly_StarPolygon_hpp_
#define starpoly_StarPolygon_hpp_

#include "libstarpoly.h"
#include "BoundingBox.hpp"
#include "Path.hpp"
#include "Point.hpp"

namespace StarPoly {

// Regular star polygon {num_points / density} inscribed into a square.
struct StarSpec
{
    int          num_points { 5 };
    // Number of points to skip when drawing a line connecting two of the star's points.
    // A line of a five-pointed star connects the first and the third point, thus its density is two.
    int          density { 2 };
    // Trace the silhouette through the inner vertices instead of the crossing connecting lines.
    bool         outlined { false };
    // Counter-clockwise on screen.
    double       rotation_degrees { 0. };
    // Must be square. min is the top-left corner, y grows down.
    BoundingBoxf bbox { BoundingBoxf::from_rect(0., 0., 100., 100.) };

    double radius() const { return 0.5 * this->bbox.width(); }
    bool operator==(const StarSpec &rhs) const {
        return this->num_points == rhs.num_points && this->density == rhs.density && this->outlined == rhs.outlined &&
               this->rotation_degrees == rhs.rotation_degrees && this->bbox == rhs.bbox;
    }
};

static constexpr int STAR_MIN_POINTS  = 5;
static constexpr int STAR_MIN_DENSITY = 2;

// Throws InvalidArgument for a non-square or empty box, too few points or too low density.
void validate(const StarSpec &spec);

// Angle of the first point of the star, so that the first point is on top before the rotation is applied.
inline double star_start_degrees(double rotation_degrees) { return 90. + rotation_degrees; }

// Points of the {num_points / density} star on a circle of radius r centered at (r, r),
// consecutive points being density * 360 / num_points degrees apart.
Pointfs star_outer_points(int num_points, int density, double start_degrees, double r);

// First point where line 0 of the closed polyline through points crosses one of the other lines,
// the two lines adjacent to line 0 excluded. Throws GeometryError if there is no such crossing.
Vec2d   star_first_intersection(const Pointfs &points);

// Distance from (r, r) to the first crossing of the star's connecting lines.
double  star_inner_radius(const Pointfs &outer_points, double r);

// num_vertices points alternating between outer_radius (even indices) and inner_radius (odd indices),
// evenly spaced around (outer_radius, outer_radius).
Pointfs star_outline_points(int num_vertices, double start_degrees, double outer_radius, double inner_radius);

// The star's closed point sequence in the coordinates of the box, relative to its top-left corner.
// Outer points only, or the outline alternating outer and inner points if spec.outlined.
Pointfs compute_star_outline(const StarSpec &spec);

// compute_star_outline() converted to a closed path placed into the box.
Path    star_path(const StarSpec &spec);

} // namespace StarPoly

#endif // starpoly_StarPolygon_hpp_
