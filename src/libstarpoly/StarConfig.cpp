#include "StarConfig.hpp"
#include "Exception.hpp"

#include <locale>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>
#include <boost/nowide/iostream.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace StarPoly {

const std::map<t_config_option_key, ConfigOptionDef>& star_config_def()
{
    static const std::map<t_config_option_key, ConfigOptionDef> def {
        { "points",     { coInt,     "N",    "Number of the star's points, at least 5." } },
        { "density",    { coInt,     "D",    "Number of points to skip when connecting two points, at least 2." } },
        { "outlined",   { coBool,    "",     "Trace the outline through the inner vertices instead of the connecting lines." } },
        { "rotation",   { coFloat,   "DEG",  "Counter-clockwise rotation in degrees." } },
        { "left",       { coFloat,   "X",    "Left edge of the bounding square." } },
        { "top",        { coFloat,   "Y",    "Top edge of the bounding square." } },
        { "width",      { coFloat,   "W",    "Width of the bounding square." } },
        { "height",     { coFloat,   "H",    "Height of the bounding square, must equal the width." } },
        { "size",       { coFloat,   "S",    "Sets both width and height." } },
        { "load",       { coStrings, "FILE", "Load star parameters from an INI file. May be repeated, the command line wins.", true } },
        { "export-svg", { coString,  "FILE", "Write the star path into an SVG file.", true } },
        { "log-file",   { coString,  "FILE", "Append the log into a file.", true } },
        { "loglevel",   { coInt,     "N",    "Log level: 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.", true } },
        { "help",       { coBool,    "",     "Show this help.", true } },
    };
    return def;
}

std::ostream& print_cli_help(std::ostream &out, std::function<bool(const ConfigOptionDef &)> filter)
{
    for (const auto &kvp : star_config_def()) {
        const ConfigOptionDef &def = kvp.second;
        if (! filter(def))
            continue;
        std::string arg = "--" + kvp.first;
        if (! def.sidetext.empty())
            arg += " " + def.sidetext;
        // Align the tooltips.
        if (arg.size() < 20)
            arg.resize(20, ' ');
        out << "  " << arg << " " << def.tooltip << std::endl;
    }
    return out;
}

template<typename T>
static T deserialize_number(const t_config_option_key &opt_key, const std::string &value)
{
    std::istringstream iss(boost::algorithm::trim_copy(value));
    // Decimal point regardless of the global locale.
    iss.imbue(std::locale::classic());
    T out;
    iss >> out;
    if (iss.fail() || ! iss.eof())
        throw StarPoly::ConfigurationError((boost::format("Invalid value \"%1%\" of option %2%") % value % opt_key).str());
    return out;
}

static bool deserialize_bool(const t_config_option_key &opt_key, const std::string &value)
{
    const std::string v = boost::algorithm::trim_copy(value);
    if (v.empty() || v == "1" || boost::iequals(v, "true") || boost::iequals(v, "yes"))
        return true;
    if (v == "0" || boost::iequals(v, "false") || boost::iequals(v, "no"))
        return false;
    throw StarPoly::ConfigurationError((boost::format("Invalid boolean value \"%1%\" of option %2%") % value % opt_key).str());
}

void StarConfig::set(const t_config_option_key &opt_key, const std::string &value)
{
    if (opt_key == "points")
        this->points = deserialize_number<int>(opt_key, value);
    else if (opt_key == "density")
        this->density = deserialize_number<int>(opt_key, value);
    else if (opt_key == "outlined")
        this->outlined = deserialize_bool(opt_key, value);
    else if (opt_key == "rotation")
        this->rotation = deserialize_number<double>(opt_key, value);
    else if (opt_key == "left")
        this->left = deserialize_number<double>(opt_key, value);
    else if (opt_key == "top")
        this->top = deserialize_number<double>(opt_key, value);
    else if (opt_key == "width")
        this->width = deserialize_number<double>(opt_key, value);
    else if (opt_key == "height")
        this->height = deserialize_number<double>(opt_key, value);
    else if (opt_key == "size")
        this->width = this->height = deserialize_number<double>(opt_key, value);
    else
        throw StarPoly::ConfigurationError("Unknown star option " + opt_key);
}

void StarConfig::apply(const t_config_option_values &values)
{
    for (const auto &kvp : values)
        this->set(kvp.first, kvp.second);
}

void StarConfig::load(const std::string &file)
{
    namespace pt = boost::property_tree;
    pt::ptree tree;
    boost::nowide::ifstream ifs(file);
    if (! ifs.is_open())
        throw StarPoly::FileIOError("Failed to open configuration file " + file);
    try {
        pt::read_ini(ifs, tree);
    } catch (pt::ptree_error &ex) {
        BOOST_LOG_TRIVIAL(error) << boost::format("Failed to parse configuration file \"%1%\": %2%") % file % ex.what();
        throw StarPoly::FileIOError((boost::format("Failed to parse configuration file \"%1%\": %2%") % file % ex.what()).str());
    }

    for (const auto &section : tree) {
        if (section.first == "star") {
            for (const auto &kvp : section.second)
                this->set(kvp.first, kvp.second.data());
        } else if (section.second.empty()) {
            // Key at the root of the file.
            this->set(section.first, section.second.data());
        } else
            throw StarPoly::ConfigurationError((boost::format("Unknown section [%1%] in configuration file \"%2%\"") % section.first % file).str());
    }
    BOOST_LOG_TRIVIAL(info) << "Loaded star configuration from " << file;
}

StarSpec StarConfig::star_spec() const
{
    StarSpec spec;
    spec.num_points       = this->points;
    spec.density          = this->density;
    spec.outlined         = this->outlined;
    spec.rotation_degrees = this->rotation;
    spec.bbox             = BoundingBoxf::from_rect(this->left, this->top, this->width, this->height);
    return spec;
}

bool CLIConfig::read_cli(int argc, const char* const argv[], t_config_option_keys *extra)
{
    const auto &def = star_config_def();

    bool parse_options = true;
    for (int i = 1; i < argc; ++ i) {
        std::string token = argv[i];
        // Store non-option arguments in the provided vector.
        if (! parse_options || ! boost::starts_with(token, "-") || token == "-") {
            extra->push_back(token);
            continue;
        }
        // Stop parsing tokens as options when -- is supplied.
        if (token == "--") {
            parse_options = false;
            continue;
        }
        // Remove leading dashes (one or two).
        token.erase(token.begin(), token.begin() + (boost::starts_with(token, "--") ? 2 : 1));
        // Read value when supplied in the --key=value form.
        std::string value;
        bool        has_value = false;
        {
            size_t equals_pos = token.find("=");
            if (equals_pos != std::string::npos) {
                value = token.substr(equals_pos+1);
                token.erase(equals_pos);
                has_value = true;
            }
        }
        auto it = def.find(token);
        if (it == def.end()) {
            boost::nowide::cerr << "Invalid option --" << token.c_str() << std::endl;
            return false;
        }
        const ConfigOptionDef &optdef = it->second;

        // If the option type expects a value and it was not already provided,
        // look for it in the next token.
        if (! has_value && optdef.type != coBool) {
            if (i == argc-1) {
                boost::nowide::cerr << "Need values for option --" << token.c_str() << std::endl;
                return false;
            }
            value = argv[++ i];
        }

        try {
            if (token == "load")
                this->load.push_back(value);
            else if (token == "export-svg")
                this->export_svg = value;
            else if (token == "log-file")
                this->log_file = value;
            else if (token == "loglevel")
                this->loglevel = deserialize_number<int>(token, value);
            else if (token == "help")
                this->help = deserialize_bool(token, value);
            else {
                // Validate now to report the option, apply later on top of the loaded files.
                StarConfig().set(token, value);
                this->star_options.emplace_back(token, value);
            }
        } catch (const StarPoly::ConfigurationError &ex) {
            boost::nowide::cerr << ex.what() << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace StarPoly
