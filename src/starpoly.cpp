#include "libstarpoly/libstarpoly.h"
#include "libstarpoly/Exception.hpp"
#include "libstarpoly/StarConfig.hpp"
#include "libstarpoly/StarPolygon.hpp"
#include "libstarpoly/SVG.hpp"
#include "libstarpoly/Utils.hpp"

#include <cstdio>
#include <string>
#include <locale>

#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/args.hpp>
#include <boost/nowide/cstdlib.hpp>
#include <boost/nowide/iostream.hpp>

using namespace StarPoly;

/// utility function for displaying CLI usage
void printUsage();

int main(int argc, char **argv)
{
    // Convert the command line arguments to UTF8 on Windows, no-op elsewhere.
    boost::nowide::args a(argc, argv);

    {
        const char *loglevel = boost::nowide::getenv("STARPOLY_LOGLEVEL");
        if (loglevel != nullptr) {
            if (loglevel[0] >= '0' && loglevel[0] <= '9' && loglevel[1] == 0)
                set_logging_level(loglevel[0] - '0');
            else
                boost::nowide::cerr << "Invalid STARPOLY_LOGLEVEL environment variable: " << loglevel << std::endl;
        }
    }

    // if any option is unsupported, print usage and abort immediately
    CLIConfig            cli_config;
    t_config_option_keys extra;
    if (! cli_config.read_cli(argc, argv, &extra)) {
        printUsage();
        return CLI_INVALID_PARAMS;
    }
    if (cli_config.help) {
        printUsage();
        return CLI_SUCCESS;
    }
    if (! extra.empty()) {
        boost::nowide::cerr << "Unexpected argument: " << extra.front() << std::endl;
        printUsage();
        return CLI_INVALID_PARAMS;
    }

    if (! cli_config.log_file.empty())
        set_log_path_and_level(cli_config.log_file, cli_config.loglevel >= 0 ? unsigned(cli_config.loglevel) : get_logging_level());
    else if (cli_config.loglevel >= 0)
        set_logging_level(unsigned(cli_config.loglevel));

    // load config files supplied via --load, command line options override them
    StarConfig config;
    for (const std::string &file : cli_config.load) {
        if (! boost::filesystem::exists(file)) {
            boost::nowide::cerr << "No such file: " << file << std::endl;
            return CLI_CONFIG_FILE_ERROR;
        }
        try {
            config.load(file);
        } catch (const StarPoly::Exception &ex) {
            boost::nowide::cerr << "Error while reading config file: " << ex.what() << std::endl;
            return CLI_CONFIG_FILE_ERROR;
        }
    }
    try {
        config.apply(cli_config.star_options);
    } catch (const StarPoly::ConfigurationError &ex) {
        boost::nowide::cerr << ex.what() << std::endl;
        return CLI_INVALID_PARAMS;
    }

    const StarSpec spec = config.star_spec();
    Path           path;
    try {
        path = star_path(spec);
    } catch (const StarPoly::InvalidArgument &ex) {
        BOOST_LOG_TRIVIAL(error) << "Invalid star parameters: " << ex.what();
        boost::nowide::cerr << ex.what() << std::endl;
        return CLI_INVALID_PARAMS;
    } catch (const StarPoly::GeometryError &ex) {
        boost::nowide::cerr << ex.what() << std::endl;
        return CLI_GEOMETRY_ERROR;
    }

    boost::nowide::cout.imbue(std::locale::classic());
    for (const PathCommand &cmd : path.commands())
        boost::nowide::cout << cmd.point.x() << " " << cmd.point.y() << "\n";
    boost::nowide::cout.flush();

    if (! cli_config.export_svg.empty()) {
        try {
            SVG::export_path(cli_config.export_svg, spec.bbox, path, spec.outlined);
        } catch (const StarPoly::FileIOError &ex) {
            BOOST_LOG_TRIVIAL(error) << ex.what();
            boost::nowide::cerr << ex.what() << std::endl;
            return CLI_EXPORT_ERROR;
        }
        BOOST_LOG_TRIVIAL(info) << "Star path exported to " << cli_config.export_svg;
    }

    close_log_file();
    return CLI_SUCCESS;
}

void printUsage()
{
    boost::nowide::cout << STARPOLY_APP_NAME << " " << STARPOLY_VERSION << " computes the outline of a regular star polygon" << std::endl
                        << "Usage: ./starpoly [ OPTIONS ]" << std::endl
                        << "Prints one \"x y\" line per path point: move to the first one, line to the others." << std::endl
                        << "** STAR OPTIONS **" << std::endl;
    print_cli_help(boost::nowide::cout, [](const ConfigOptionDef &def) { return ! def.cli_only; });
    boost::nowide::cout << "** CLI OPTIONS **" << std::endl;
    print_cli_help(boost::nowide::cout, [](const ConfigOptionDef &def) { return def.cli_only; });
}
