#ifndef starpoly_Utils_hpp_
#define starpoly_Utils_hpp_

#include <string>

#include "libstarpoly.h"

// Exit codes of the command line tool.
#define CLI_SUCCESS                  0
#define CLI_ENVIRONMENT_ERROR       -1
#define CLI_INVALID_PARAMS          -2
#define CLI_CONFIG_FILE_ERROR       -3
#define CLI_EXPORT_ERROR            -4

#define CLI_GEOMETRY_ERROR        -100

namespace StarPoly {

extern void set_logging_level(unsigned int level);
extern unsigned int level_string_to_boost(std::string level);
extern std::string  get_string_logging_level(unsigned level);
extern unsigned get_logging_level();
extern void trace(unsigned int level, const char *message);
// Log into a file in addition to the console, the level is applied to both.
extern void set_log_path_and_level(const std::string& file, unsigned int level);
extern void flush_logs();
// Detach the file sink installed by set_log_path_and_level(), the log goes to the console again.
extern void close_log_file();

} // namespace StarPoly

#endif // starpoly_Utils_hpp_
