#ifndef MD_WRITER_WRITER_CONFIG_H
#define MD_WRITER_WRITER_CONFIG_H

#include "logger.h"

#include <boost/log/trivial.hpp>
#include <istream>
#include <optional>
#include <string>

namespace md_writer {

// Settings for the md_writer tool. Every field has a default, so an empty
// JSON object is a valid config.
struct WriterConfig {
    Logger::LoggerOptions log;
    std::string html_title = "Markdown Preview";
    std::optional<std::string> default_info_string;
};

// Maps "trace", "debug", "info", "warning", "error" or "fatal"
// (any case) to a severity. Returns false for anything else.
bool ParseSeverity(const std::string& name, boost::log::trivial::severity_level* severity);

// Reads a JSON config of the form
//   { "log": { "level": "info", "console": false,
//              "file": "logs/md_writer_%Y-%m-%d.log" },
//     "html": { "title": "..." },
//     "fragment": { "info_string": "cpp" } }
// Missing keys keep the values already in *config. Returns false on malformed
// JSON, a non-scalar value, an unknown log level, a console flag other than
// true/false, or an empty log file name.
bool ParseWriterConfig(std::istream& input, WriterConfig* config);

// Opens `path` and parses it with ParseWriterConfig.
bool LoadWriterConfig(const std::string& path, WriterConfig* config);

}  // namespace md_writer

#endif  // MD_WRITER_WRITER_CONFIG_H
