#include "writer_config.h"

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <fstream>
#include <unordered_map>

namespace pt = boost::property_tree;
namespace severity = boost::log::trivial;

namespace md_writer {

bool ParseSeverity(const std::string& name, severity::severity_level* level) {
  static const std::unordered_map<std::string, severity::severity_level> levels = {
    {"trace",   severity::trace},
    {"debug",   severity::debug},
    {"info",    severity::info},
    {"warning", severity::warning},
    {"error",   severity::error},
    {"fatal",   severity::fatal}
  };

  auto it = levels.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name)));
  if (it == levels.end()) {
    return false;
  }
  *level = it->second;
  return true;
}

namespace {

// Reads the scalar at `path` into *value, leaving it unset when the key is
// missing. Objects and arrays with members are rejected.
bool ReadString(const pt::ptree& tree, const std::string& path,
                std::optional<std::string>* value) {
  auto node = tree.get_child_optional(path);
  if (!node) {
    return true;
  }
  if (!node->empty()) {
    Logger::log_error("Config value " + path + " must be a string, not an object or array");
    return false;
  }
  *value = node->data();
  return true;
}

}  // namespace

bool ParseWriterConfig(std::istream& input, WriterConfig* config) {
  pt::ptree tree;
  try {
    pt::read_json(input, tree);
  }
  catch (const pt::json_parser_error& e) {
    Logger::log_error(std::string("Malformed config: ") + e.what());
    return false;
  }

  // Work on a copy so a bad value leaves *config untouched
  WriterConfig parsed = *config;

  std::optional<std::string> level;
  std::optional<std::string> console;
  std::optional<std::string> file;
  std::optional<std::string> title;
  std::optional<std::string> info;
  if (!ReadString(tree, "log.level", &level) ||
      !ReadString(tree, "log.console", &console) ||
      !ReadString(tree, "log.file", &file) ||
      !ReadString(tree, "html.title", &title) ||
      !ReadString(tree, "fragment.info_string", &info)) {
    return false;
  }

  if (level && !ParseSeverity(*level, &parsed.log.level)) {
    Logger::log_error("Unknown log level in config: " + *level);
    return false;
  }
  if (console) {
    std::string flag = boost::algorithm::to_lower_copy(*console);
    if (flag != "true" && flag != "false") {
      Logger::log_error("log.console must be true or false, got: " + *console);
      return false;
    }
    parsed.log.console = (flag == "true");
  }
  if (file) {
    // An empty object also reads back as "", so both land here
    if (file->empty()) {
      Logger::log_error("log.file must be a non-empty file name");
      return false;
    }
    parsed.log.file = *file;
  }
  if (title) {
    parsed.html_title = *title;
  }
  if (info) {
    parsed.default_info_string = *info;
  }

  *config = std::move(parsed);
  return true;
}

bool LoadWriterConfig(const std::string& path, WriterConfig* config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    Logger::log_error("Unable to open config file: " + path);
    Logger::log_config_parsing(path, false);
    return false;
  }

  bool success = ParseWriterConfig(file, config);
  Logger::log_config_parsing(path, success);
  return success;
}

}  // namespace md_writer
