#ifndef MD_WRITER_LOGGER_H
#define MD_WRITER_LOGGER_H

#include <boost/log/trivial.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace md_writer {
namespace Logger {

    struct LoggerOptions {
        // Records below this severity are dropped
        boost::log::trivial::severity_level level = boost::log::trivial::warning;
        // Console sink on std::clog
        bool console = true;
        // File name pattern for the rotating file sink; console only when unset
        std::optional<std::string> file;
    };

    //Initialize logger system with optional console output and file rotation.
    //With neither sink, logging is disabled. Calling it again replaces the
    //sinks of the previous call.
    void init_logger(const LoggerOptions& options = LoggerOptions());

    //Logging functions at different severity levels
    void log_trace(const std::string& message);
    void log_debug(const std::string& message);
    void log_info(const std::string& message);
    void log_warning(const std::string& message);
    void log_error(const std::string& message);
    void log_fatal(const std::string& message);

    //Tool-specific logging functions
    void log_config_parsing(const std::string& filename, bool success);
    void log_fragment(const std::string& kind, std::size_t input_bytes, std::size_t output_bytes);

}  // namespace Logger
}  // namespace md_writer

#endif  // MD_WRITER_LOGGER_H
