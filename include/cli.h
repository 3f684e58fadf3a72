#ifndef MD_WRITER_CLI_H
#define MD_WRITER_CLI_H

#include <iosfwd>
#include <string>
#include <vector>

namespace md_writer {

// Exit statuses of the md_writer tool
constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitResourceExhausted = 2;

// Usage text printed by --help and on argument errors.
std::string CliUsage();

// Runs the md_writer tool. `args` excludes the program name. Text comes from
// the arguments after the fragment name, or from `in` when there are none.
// Returns the process exit status.
int RunCli(const std::vector<std::string>& args,
           std::istream& in,
           std::ostream& out,
           std::ostream& err);

}  // namespace md_writer

#endif  // MD_WRITER_CLI_H
