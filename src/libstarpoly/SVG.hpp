#ifndef starpoly_SVG_hpp_
#define starpoly_SVG_hpp_

#include "libstarpoly.h"
#include "BoundingBox.hpp"
#include "Path.hpp"

#include <cstdio>
#include <string>

namespace StarPoly {

class SVG
{
public:
    std::string fill, stroke;
    Vec2d origin;

    SVG(const std::string &filename, const BoundingBoxf &bbox, double bbox_offset = 1.) :
        fill("grey"), stroke("black"), origin(bbox.min - Vec2d(bbox_offset, bbox_offset)), filename(filename)
        { open(filename, bbox, bbox_offset); }
    ~SVG() { if (f != nullptr) Close(); }

    bool open(const std::string &filename, const BoundingBoxf &bbox, double bbox_offset = 1.);
    bool is_opened() const { return f != nullptr; }

    void draw(const Path &path, bool fill = false, double stroke_width = 0);
    void draw(const Vec2d &point, std::string fill = "black", double radius = 0);
    void draw(const Pointfs &points, std::string fill = "black", double radius = 0);

    void Close();

    // Writes the path framed by bbox. Throws FileIOError if the file cannot be created.
    static void export_path(const std::string &path, const BoundingBoxf &bbox, const Path &star_path, bool fill = false);

private:
    std::string filename;
    FILE* f { nullptr };

    void path(const std::string &d, bool fill, double stroke_width, const float fill_opacity);
    std::string get_path_d(const Path &path) const;
};

} // namespace StarPoly

#endif
