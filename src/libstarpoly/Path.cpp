#include "Path.hpp"

#include <locale>
#include <sstream>

namespace StarPoly {

Pointfs Path::points() const
{
    Pointfs out = reserve_vector<Vec2d>(m_commands.size());
    for (const PathCommand &cmd : m_commands)
        out.emplace_back(cmd.point);
    return out;
}

bool Path::closed() const
{
    return m_commands.size() > 1 && m_commands.front().point == m_commands.back().point;
}

std::string Path::svg_data() const
{
    std::ostringstream d;
    d.imbue(std::locale::classic());
    for (auto it = m_commands.begin(); it != m_commands.end(); ++ it) {
        if (it != m_commands.begin())
            d << " ";
        d << (it->type == PathCommandType::MoveTo ? "M " : "L ") << it->point.x() << " " << it->point.y();
    }
    return d.str();
}

Path make_closed_path(const Pointfs &points, const Vec2d &offset)
{
    Path path;
    if (points.empty())
        return path;
    path.move_to(points.front() + offset);
    for (auto it = points.begin() + 1; it != points.end(); ++ it)
        path.line_to(*it + offset);
    path.line_to(points.front() + offset);
    return path;
}

} // namespace StarPoly
