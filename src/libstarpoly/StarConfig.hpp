#ifndef starpoly_StarConfig_hpp_
#define starpoly_StarConfig_hpp_

#include "libstarpoly.h"
#include "StarPolygon.hpp"

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace StarPoly {

enum ConfigOptionType {
    coInt,
    coFloat,
    coBool,
    coString,
    // Repeated use of the option appends the value.
    coStrings,
};

struct ConfigOptionDef
{
    ConfigOptionType type;
    // Value as printed by the usage.
    std::string      sidetext;
    std::string      tooltip;
    // The option is accepted on the command line only, not in a config file.
    bool             cli_only { false };
};

typedef std::string t_config_option_key;
typedef std::vector<std::string> t_config_option_keys;
typedef std::vector<std::pair<t_config_option_key, std::string>> t_config_option_values;

// Definitions of all options understood by the command line, ordered by key.
const std::map<t_config_option_key, ConfigOptionDef>& star_config_def();

// Prints a line "--key SIDETEXT  tooltip" for each option passing the filter.
std::ostream& print_cli_help(std::ostream &out, std::function<bool(const ConfigOptionDef &)> filter);

// Star parameters, loaded from INI files and overriden from the command line.
class StarConfig
{
public:
    int    points    { 5 };
    int    density   { 2 };
    bool   outlined  { false };
    double rotation  { 0. };
    double left      { 0. };
    double top       { 0. };
    double width     { 100. };
    double height    { 100. };

    // Deserialize a single value. Throws ConfigurationError for an unknown key or a malformed value.
    void     set(const t_config_option_key &opt_key, const std::string &value);
    void     apply(const t_config_option_values &values);
    // Keys either at the root of the file or in the [star] section.
    // Throws FileIOError if the file cannot be read or parsed, ConfigurationError for unknown keys or malformed values.
    void     load(const std::string &file);
    StarSpec star_spec() const;
};

// Options controlling the command line tool itself.
class CLIConfig
{
public:
    t_config_option_keys   load;
    std::string            export_svg;
    std::string            log_file;
    int                    loglevel { -1 };
    bool                   help { false };
    // Star options in the order of the command line, applied after the loaded files.
    t_config_option_values star_options;

    // Parse --key value, --key=value and boolean --key. Non-option arguments are stored into extra.
    // Prints the offending option to stderr and returns false if an option is unknown or misses its value.
    bool read_cli(int argc, const char* const argv[], t_config_option_keys *extra);
};

} // namespace StarPoly

#endif // starpoly_StarConfig_hpp_
