#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "cli.h"
#include "logger.h"

int main(int argc, char* argv[]) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    return md_writer::RunCli(args, std::cin, std::cout, std::cerr);
  }
  catch (const std::exception& e) {
    std::cerr << "Exception: " << e.what() << "\n";
    md_writer::Logger::log_error(std::string("Unhandled exception: ") + e.what());
  }

  return md_writer::kExitUsage;
}
