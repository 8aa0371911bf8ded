#include "Utils.hpp"

#include <map>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>

namespace StarPoly {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::error;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everyting including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned int level_string_to_boost(std::string level)
{
    static const std::map<std::string, unsigned int> levels {
        { "fatal",   0 },
        { "error",   1 },
        { "warning", 2 },
        { "info",    3 },
        { "debug",   4 },
        { "trace",   5 },
    };
    auto it = levels.find(level);
    // Unknown names fall back to errors only.
    return it == levels.end() ? 1 : it->second;
}

std::string get_string_logging_level(unsigned level)
{
    switch (level) {
    case 0: return "fatal";
    case 1: return "error";
    case 2: return "warning";
    case 3: return "info";
    case 4: return "debug";
    case 5: return "trace";
    default: return "error";
    }
}

unsigned get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal : return 0;
    case boost::log::trivial::error : return 1;
    case boost::log::trivial::warning : return 2;
    case boost::log::trivial::info : return 3;
    case boost::log::trivial::debug : return 4;
    case boost::log::trivial::trace : return 5;
    default: return 1;
    }
}

// Warnings and worse are reported until the application decides otherwise.
static struct RunOnInit {
    RunOnInit() {
        set_logging_level(2);
    }
} g_RunOnInit;

void trace(unsigned int level, const char *message)
{
    boost::log::trivial::severity_level severity = level_to_boost(level);

    BOOST_LOG_STREAM_WITH_PARAMS(::boost::log::trivial::logger::get(),\
        (::boost::log::keywords::severity = severity)) << message;
}

static boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> g_log_sink;

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void set_log_path_and_level(const std::string& file, unsigned int level)
{
    if (g_log_sink) {
        logging::core::get()->remove_sink(g_log_sink);
        g_log_sink.reset();
    }

    g_log_sink = boost::log::add_file_log(
        keywords::file_name = file,
        keywords::open_mode = std::ios_base::app,
        keywords::format =
        (
            expr::stream
            << "[" << expr::format_date_time< boost::posix_time::ptime >("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
            << "[" << expr::attr< logging::trivial::severity_level >("Severity") << "]\t"
            << expr::smessage
        )
    );

    logging::add_common_attributes();

    set_logging_level(level);
}

void flush_logs()
{
    if (g_log_sink)
        g_log_sink->flush();
}

void close_log_file()
{
    if (g_log_sink) {
        g_log_sink->flush();
        logging::core::get()->remove_sink(g_log_sink);
        g_log_sink.reset();
    }
}

} // namespace StarPoly
