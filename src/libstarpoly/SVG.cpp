#include "SVG.hpp"
#include "Exception.hpp"

#include <boost/log/trivial.hpp>
#include <boost/nowide/cstdio.hpp>

namespace StarPoly {

bool SVG::open(const std::string &afilename, const BoundingBoxf &bbox, double bbox_offset)
{
    this->filename = afilename;
    this->origin   = bbox.min - Vec2d(bbox_offset, bbox_offset);
    this->f        = boost::nowide::fopen(afilename.c_str(), "w");
    if (this->f == nullptr)
        return false;
    float w = float(bbox.width()  + 2 * bbox_offset);
    float h = float(bbox.height() + 2 * bbox_offset);
    fprintf(this->f,
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.0//EN\" \"http://www.w3.org/TR/2001/REC-SVG-20010904/DTD/svg10.dtd\">\n"
        "<svg height=\"%f\" width=\"%f\" xmlns=\"http://www.w3.org/2000/svg\" xmlns:svg=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\">\n",
        h, w);
    fprintf(this->f, "<rect fill='white' stroke='none' x='0' y='0' width='%f' height='%f'/>\n", w, h);
    return true;
}

void SVG::draw(const Path &path, bool fill, double stroke_width)
{
    if (path.empty())
        return;
    this->path(this->get_path_d(path), fill, stroke_width, 1.f);
}

void SVG::draw(const Vec2d &point, std::string fill, double iradius)
{
    double radius = (iradius == 0) ? 3. : iradius;
    fprintf(this->f,
        "   <circle cx=\"%f\" cy=\"%f\" r=\"%f\" style=\"stroke: none; fill: %s\" />\n",
        point.x() - origin.x(), point.y() - origin.y(), radius, fill.c_str());
}

void SVG::draw(const Pointfs &points, std::string fill, double radius)
{
    for (const Vec2d &pt : points)
        this->draw(pt, fill, radius);
}

void SVG::path(const std::string &d, bool fill, double stroke_width, const float fill_opacity)
{
    float lineWidth = 0.f;
    if (! fill)
        lineWidth = (stroke_width == 0) ? 1.f : float(stroke_width);

    fprintf(
        this->f,
        "   <path d=\"%s\" style=\"fill: %s; stroke: %s; stroke-width: %f; fill-rule: evenodd\" fill-opacity=\"%f\" />\n",
        d.c_str(),
        fill ? this->fill.c_str() : "none",
        this->stroke.c_str(),
        lineWidth,
        fill_opacity
    );
}

std::string SVG::get_path_d(const Path &path) const
{
    // Shift by the origin of the document, the commands are kept.
    Path shifted;
    for (const PathCommand &cmd : path.commands()) {
        if (cmd.type == PathCommandType::MoveTo)
            shifted.move_to(cmd.point - origin);
        else
            shifted.line_to(cmd.point - origin);
    }
    return shifted.svg_data();
}

void SVG::Close()
{
    fprintf(this->f, "</svg>\n");
    fclose(this->f);
    this->f = nullptr;
    BOOST_LOG_TRIVIAL(debug) << "SVG written to " << this->filename;
}

void SVG::export_path(const std::string &path, const BoundingBoxf &bbox, const Path &star_path, bool fill)
{
    SVG svg(path, bbox);
    if (! svg.is_opened())
        throw StarPoly::FileIOError("Failed to create SVG file " + path);
    svg.draw(star_path, fill);
    svg.draw(star_path.points(), "red");
    svg.Close();
}

} // namespace StarPoly
