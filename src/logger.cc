#include "logger.h"

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>

#include <iostream>
#include <sstream>

namespace logging = boost::log;
namespace attrs = boost::log::attributes;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;

namespace md_writer {

void Logger::init_logger(const LoggerOptions& options) {
    logging::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    auto core = logging::core::get();
    core->remove_all_sinks();

    const logging::formatter format = expr::stream
        << "[" << expr::attr<boost::posix_time::ptime>("TimeStamp") << "]"
        << " [T:" << expr::attr<attrs::current_thread_id::value_type>("ThreadID") << "]"
        << " [" << expr::attr<boost::log::trivial::severity_level>("Severity") << "] "
        << expr::smessage;

    //Console sink
    if (options.console) {
        logging::add_console_log(std::clog, keywords::format = format);
    }

    // File sink: rotate daily at midnight or when >10MB
    if (options.file) {
        logging::add_file_log(
            keywords::file_name = *options.file,
            keywords::rotation_size = 10u * 1024u * 1024u,
            keywords::time_based_rotation = sinks::file::rotation_at_time_point(0,0,0),
            keywords::auto_flush = true,
            keywords::open_mode = std::ios_base::out | std::ios_base::app,
            keywords::format = format
        );
    }

    core->set_filter(logging::trivial::severity >= options.level);

    // Without sinks the core would fall back to its default stdout sink
    core->set_logging_enabled(options.console || options.file.has_value());

    // Common attributes: TimeStamp, ThreadID
    logging::add_common_attributes();
}

//Severity-level logging implementations using BOOST_LOG_TRIVIAL
void Logger::log_trace(const std::string& message)   { BOOST_LOG_TRIVIAL(trace)   << message; }
void Logger::log_debug(const std::string& message)   { BOOST_LOG_TRIVIAL(debug)   << message; }
void Logger::log_info(const std::string& message)    { BOOST_LOG_TRIVIAL(info)    << message; }
void Logger::log_warning(const std::string& message) { BOOST_LOG_TRIVIAL(warning) << message; }
void Logger::log_error(const std::string& message)   { BOOST_LOG_TRIVIAL(error)   << message; }
void Logger::log_fatal(const std::string& message)   { BOOST_LOG_TRIVIAL(fatal)   << message; }

void Logger::log_config_parsing(const std::string& filename, bool success) {
    if (success) {
        Logger::log_info("Config file parsed: " + filename + " (success)");
    } else {
        Logger::log_error("Config file parsed: " + filename + " (failure)");
    }
}

// Fragment metrics should be machine-parsable
void Logger::log_fragment(const std::string& kind,
                          std::size_t input_bytes,
                          std::size_t output_bytes) {
    std::ostringstream log_line;
    log_line <<
        "[FragmentMetrics] " <<
        "kind:" << kind << " " <<
        "input_bytes:" << input_bytes << " " <<
        "output_bytes:" << output_bytes;
    Logger::log_info(log_line.str());
}

}  // namespace md_writer
