#include "StarPolygon.hpp"
#include "Exception.hpp"
#include "Line.hpp"

#include <cmath>
#include <cstdint>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace StarPoly {

// Counter-clockwise on screen is clockwise in the y up frame of rotate(), thus the angle is negated.
static inline Vec2d point_on_circle(double center, double radius, double degrees)
{
    return Vec2d(center, center) + rotated(Vec2d(radius, 0.), - deg2rad(degrees), Vec2d::Zero());
}

static void validate_counts(int num_points, int density)
{
    if (num_points < STAR_MIN_POINTS)
        throw StarPoly::InvalidArgument((boost::format("Number of points must be at least %1%, got %2%") % STAR_MIN_POINTS % num_points).str());
    if (density < STAR_MIN_DENSITY)
        throw StarPoly::InvalidArgument((boost::format("Density must be at least %1%, got %2%") % STAR_MIN_DENSITY % density).str());
}

void validate(const StarSpec &spec)
{
    if (empty(spec.bbox))
        throw StarPoly::InvalidArgument("Bounding box of a star must not be empty");
    if (! spec.bbox.is_square())
        throw StarPoly::InvalidArgument((boost::format("Bounding box of a star must be square, got %1% x %2%")
            % spec.bbox.width() % spec.bbox.height()).str());
    validate_counts(spec.num_points, spec.density);
}

Pointfs star_outer_points(int num_points, int density, double start_degrees, double r)
{
    validate_counts(num_points, density);

    const double degrees_between_points = 360. / num_points;
    Pointfs      out = reserve_vector<Vec2d>(num_points);
    for (int i = 0; i < num_points; ++ i) {
        // Reduced modulo the point count, density * i overflows an int for large stars.
        const int64_t step = int64_t(density) * int64_t(i) % int64_t(num_points);
        out.emplace_back(point_on_circle(r, r, start_degrees + double(step) * degrees_between_points));
    }
    return out;
}

Vec2d star_first_intersection(const Pointfs &points)
{
    const Linesf lines = to_lines_closed(points);
    if (! lines.empty()) {
        const Linef &first = lines.front();
        BOOST_LOG_TRIVIAL(trace) << "star_first_intersection: first line " << to_string(first.a) << " - " << to_string(first.b)
                                 << ", slope " << first.slope() << ", y-intercept " << first.y_intercept();
        // Line 1 and the last line share an end point with line 0, they can't cross it.
        for (size_t i = 2; i + 1 < lines.size(); ++ i) {
            Vec2d ipt;
            if (first.intersection_strict(lines[i], &ipt)) {
                BOOST_LOG_TRIVIAL(trace) << "star_first_intersection: line " << i << " crosses the first line at " << to_string(ipt);
                return ipt;
            }
        }
    }
    BOOST_LOG_TRIVIAL(error) << "star_first_intersection: no crossing found among " << points.size() << " points";
    throw StarPoly::GeometryError("Not a valid star polygon: its connecting lines do not cross. Are the number of points and density valid?");
}

double star_inner_radius(const Pointfs &outer_points, double r)
{
    return distance(Vec2d(r, r), star_first_intersection(outer_points));
}

Pointfs star_outline_points(int num_vertices, double start_degrees, double outer_radius, double inner_radius)
{
    const double degrees_between_points = 360. / num_vertices;
    Pointfs      out = reserve_vector<Vec2d>(num_vertices);
    for (int i = 0; i < num_vertices; ++ i)
        out.emplace_back(point_on_circle(outer_radius, i % 2 == 0 ? outer_radius : inner_radius, start_degrees + i * degrees_between_points));
    return out;
}

Pointfs compute_star_outline(const StarSpec &spec)
{
    validate(spec);

    const double r             = spec.radius();
    const double start_degrees = star_start_degrees(spec.rotation_degrees);

    Pointfs outer_points = star_outer_points(spec.num_points, spec.density, start_degrees, r);
    if (! spec.outlined)
        return outer_points;

    const double inner_radius = star_inner_radius(outer_points, r);
    BOOST_LOG_TRIVIAL(debug) << "Star {" << spec.num_points << "/" << spec.density << "}: outer radius " << r << ", inner radius " << inner_radius;
    return star_outline_points(spec.num_points * 2, start_degrees, r, inner_radius);
}

Path star_path(const StarSpec &spec)
{
    return make_closed_path(compute_star_outline(spec), spec.bbox.min);
}

} // namespace StarPoly
