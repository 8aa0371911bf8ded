#include <catch2/catch.hpp>

#include "libstarpoly/Path.hpp"
#include "libstarpoly/SVG.hpp"
#include "libstarpoly/StarPolygon.hpp"
#include "libstarpoly/Exception.hpp"

#include <iterator>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/nowide/fstream.hpp>

using namespace StarPoly;

static std::string read_file(const boost::filesystem::path &path)
{
    boost::nowide::ifstream ifs(path.string());
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

SCENARIO("Closed path from a point sequence", "[Path]") {
    GIVEN("Three points") {
        Pointfs points { { 1., 2. }, { 3., 4. }, { 5., 0. } };
        WHEN("Converted without an offset") {
            Path path = make_closed_path(points, Vec2d::Zero());
            THEN("It moves to the first point and returns to it") {
                REQUIRE(path.size() == 4);
                REQUIRE(path.commands()[0] == PathCommand{ PathCommandType::MoveTo, Vec2d(1., 2.) });
                REQUIRE(path.commands()[1] == PathCommand{ PathCommandType::LineTo, Vec2d(3., 4.) });
                REQUIRE(path.commands()[2] == PathCommand{ PathCommandType::LineTo, Vec2d(5., 0.) });
                REQUIRE(path.commands()[3] == PathCommand{ PathCommandType::LineTo, Vec2d(1., 2.) });
                REQUIRE(path.closed());
            }
            THEN("SVG path data lists the commands") {
                REQUIRE(path.svg_data() == "M 1 2 L 3 4 L 5 0 L 1 2");
            }
        }
        WHEN("Converted with an offset") {
            Path path = make_closed_path(points, Vec2d(10., 0.5));
            THEN("All points are shifted") {
                Pointfs shifted = path.points();
                REQUIRE(shifted.size() == 4);
                REQUIRE(shifted.front() == Vec2d(11., 2.5));
                REQUIRE(shifted[2] == Vec2d(15., 0.5));
                REQUIRE(shifted.back() == shifted.front());
                REQUIRE(path.svg_data() == "M 11 2.5 L 13 4.5 L 15 0.5 L 11 2.5");
            }
        }
    }
    GIVEN("No points") {
        Path path = make_closed_path(Pointfs(), Vec2d(1., 1.));
        THEN("The path is empty") {
            REQUIRE(path.empty());
            REQUIRE_FALSE(path.closed());
            REQUIRE(path.svg_data().empty());
        }
    }
    GIVEN("A single point") {
        Path path = make_closed_path(Pointfs{ { 1., 1. } }, Vec2d::Zero());
        THEN("It moves to the point and draws a zero length line") {
            REQUIRE(path.size() == 2);
            REQUIRE(path.closed());
        }
    }
}

TEST_CASE("Path built command by command", "[Path]") {
    Path path;
    path.move_to(Vec2d(0., 0.));
    path.line_to(Vec2d(1., 0.));
    REQUIRE_FALSE(path.closed());
    path.line_to(Vec2d(0., 0.));
    REQUIRE(path.closed());
    REQUIRE(path.svg_data() == "M 0 0 L 1 0 L 0 0");
}

TEST_CASE("SVG export of a star", "[SVG]") {
    namespace fs = boost::filesystem;
    StarSpec spec;
    spec.outlined = true;
    spec.bbox     = BoundingBoxf::from_rect(10., 10., 50., 50.);
    Path path = star_path(spec);

    SECTION("Written into a file") {
        fs::path svg_path = fs::temp_directory_path() / fs::unique_path("starpoly-%%%%-%%%%.svg");
        SVG::export_path(svg_path.string(), spec.bbox, path);
        REQUIRE(fs::exists(svg_path));
        std::string content = read_file(svg_path);
        REQUIRE(content.find("<svg") != std::string::npos);
        REQUIRE(content.find("<path d=\"M ") != std::string::npos);
        // One red dot per path command.
        size_t num_circles = 0;
        for (size_t pos = content.find("<circle"); pos != std::string::npos; pos = content.find("<circle", pos + 1))
            ++ num_circles;
        REQUIRE(num_circles == path.size());
        REQUIRE(content.find("</svg>") != std::string::npos);
        fs::remove(svg_path);
    }
    SECTION("Written into a directory that does not exist") {
        fs::path svg_path = fs::temp_directory_path() / fs::unique_path("starpoly-missing-%%%%-%%%%") / "star.svg";
        REQUIRE_THROWS_AS(SVG::export_path(svg_path.string(), spec.bbox, path), StarPoly::FileIOError);
    }
}
