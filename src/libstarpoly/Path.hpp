#ifndef starpoly_Path_hpp_
#define starpoly_Path_hpp_

#include "libstarpoly.h"
#include "Point.hpp"

#include <string>

namespace StarPoly {

enum class PathCommandType : unsigned char {
    MoveTo,
    LineTo,
};

struct PathCommand
{
    PathCommandType type;
    Vec2d           point;

    bool operator==(const PathCommand &rhs) const { return this->type == rhs.type && this->point == rhs.point; }
};

// Straight line drawing commands handed over to a drawing API.
class Path
{
public:
    void move_to(const Vec2d &pt) { m_commands.push_back({ PathCommandType::MoveTo, pt }); }
    void line_to(const Vec2d &pt) { m_commands.push_back({ PathCommandType::LineTo, pt }); }

    const std::vector<PathCommand>& commands() const { return m_commands; }
    bool   empty() const { return m_commands.empty(); }
    size_t size() const { return m_commands.size(); }
    // Points of all commands in order.
    Pointfs points() const;
    // The path ends where it started.
    bool   closed() const;
    // Serialized into the "d" attribute of an SVG path element: "M x y L x y ...".
    std::string svg_data() const;

private:
    std::vector<PathCommand> m_commands;
};

// Move to the first point, line to each of the other points and line back to the first point,
// all points translated by offset.
Path make_closed_path(const Pointfs &points, const Vec2d &offset);

} // namespace StarPoly

#endif // starpoly_Path_hpp_
