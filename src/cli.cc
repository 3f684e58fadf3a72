#include "cli.h"

#include "builtin_fragments.h"
#include "fragment_registry.h"
#include "logger.h"
#include "markdown_converter.h"
#include "text_util.h"
#include "writer_config.h"

#include <boost/algorithm/string/join.hpp>

#include <iostream>
#include <iterator>
#include <new>
#include <optional>
#include <stdexcept>

namespace md_writer {

namespace {

enum class OutputMode { kMarkdown, kHtml, kHtmlPage };

struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> info_string;
  OutputMode mode = OutputMode::kMarkdown;
  bool list = false;
  bool help = false;
  std::string fragment;
  std::vector<std::string> words;
};

// Options come before the fragment name; everything after it is text.
bool ParseArgs(const std::vector<std::string>& args, CliOptions* options, std::string* error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (!options->fragment.empty()) {
      options->words.push_back(arg);
    } else if (arg == "--help" || arg == "-h") {
      options->help = true;
    } else if (arg == "--list") {
      options->list = true;
    } else if (arg == "--html") {
      options->mode = OutputMode::kHtml;
    } else if (arg == "--html-page") {
      options->mode = OutputMode::kHtmlPage;
    } else if (arg == "--info" || arg == "--config") {
      if (i + 1 >= args.size()) {
        *error = "Missing value for " + arg;
        return false;
      }
      if (arg == "--info") {
        options->info_string = args[++i];
      } else {
        options->config_path = args[++i];
      }
    } else if (arg == "--") {
      if (i + 1 >= args.size()) {
        *error = "Missing fragment name";
        return false;
      }
      options->fragment = args[++i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      *error = "Unknown option: " + arg;
      return false;
    } else {
      options->fragment = arg;
    }
  }

  if (options->fragment.empty() && !options->help && !options->list) {
    *error = "Missing fragment name";
    return false;
  }
  return true;
}

// Whole stream, minus a single trailing LF or CRLF.
std::string ReadText(std::istream& in) {
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (!text.empty() && text.back() == kLineFeed) {
    text.pop_back();
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
  }
  return text;
}

bool TakesInfoString(const std::string& fragment) {
  return fragment == fragment_names::kCodeFence ||
         fragment == fragment_names::kFencedCodeBlock;
}

}  // namespace

std::string CliUsage() {
  return "Usage: md_writer [options] <fragment> [text...]\n"
         "\n"
         "Prints a Markdown fragment built from the text. With no text\n"
         "arguments the text is read from standard input.\n"
         "\n"
         "Options:\n"
         "  --info <string>   info string for code-fence and fenced-code-block\n"
         "  --config <path>   JSON configuration file\n"
         "  --html            print the fragment rendered as HTML\n"
         "  --html-page       print the rendered fragment as a full HTML page\n"
         "  --list            list fragment names\n"
         "  --help            show this message\n";
}

int RunCli(const std::vector<std::string>& args,
           std::istream& in,
           std::ostream& out,
           std::ostream& err) {
  // Errors already go to `err`; the console sink is opt-in through the config.
  WriterConfig config;
  config.log.console = false;
  Logger::init_logger(config.log);

  CliOptions options;
  std::string error;
  if (!ParseArgs(args, &options, &error)) {
    err << error << "\n" << CliUsage();
    Logger::log_error(error);
    return kExitUsage;
  }

  if (options.help) {
    out << CliUsage();
    return kExitSuccess;
  }

  if (options.config_path) {
    if (!LoadWriterConfig(*options.config_path, &config)) {
      err << "Config parse error: " << *options.config_path << "\n";
      return kExitUsage;
    }
    Logger::init_logger(config.log);
  }

  if (options.list) {
    for (const auto& name : FragmentRegistry::FragmentNames()) {
      out << name << "\n";
    }
    return kExitSuccess;
  }

  if (!FragmentRegistry::HasFragment(options.fragment)) {
    err << "Unknown fragment: " << options.fragment << "\n";
    Logger::log_error("Unknown fragment: " + options.fragment);
    return kExitUsage;
  }

  std::optional<std::string> info_string =
      options.info_string ? options.info_string : config.default_info_string;
  if (options.info_string && !TakesInfoString(options.fragment)) {
    Logger::log_warning("--info ignored by fragment " + options.fragment);
  }

  try {
    // A lone fence has no body, so it never waits on standard input.
    std::string text;
    if (!options.words.empty()) {
      text = boost::algorithm::join(options.words, " ");
    } else if (options.fragment != fragment_names::kCodeFence) {
      text = ReadText(in);
      Logger::log_trace("Read " + std::to_string(text.size()) + " bytes from standard input");
    }

    std::string fragment = FragmentRegistry::BuildFragment(options.fragment, text, info_string);
    Logger::log_fragment(options.fragment, text.size(), fragment.size());

    switch (options.mode) {
      case OutputMode::kMarkdown:
        out << fragment << kLineFeed;
        break;
      case OutputMode::kHtml:
        out << markdown::ConvertToHtml(fragment);
        break;
      case OutputMode::kHtmlPage:
        out << markdown::WrapInHtmlTemplate(markdown::ConvertToHtml(fragment),
                                            config.html_title);
        break;
    }
  }
  catch (const std::length_error& e) {
    err << "Fragment too large: " << e.what() << "\n";
    Logger::log_fatal(std::string("Fragment too large: ") + e.what());
    return kExitResourceExhausted;
  }
  catch (const std::bad_alloc& e) {
    err << "Out of memory: " << e.what() << "\n";
    Logger::log_fatal(std::string("Out of memory: ") + e.what());
    return kExitResourceExhausted;
  }

  return kExitSuccess;
}

}  // namespace md_writer
