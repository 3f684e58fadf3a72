#ifndef MD_WRITER_TEXT_UTIL_H
#define MD_WRITER_TEXT_UTIL_H

#include <cstddef>
#include <string>

namespace md_writer {

// Separator for every multi-line fragment, independent of the host platform.
constexpr char kLineFeed = '\n';

// Number of Unicode scalar values in a UTF-8 string. Each byte that is not a
// continuation byte (10xxxxxx) starts a new code point, so malformed input
// still yields a count instead of failing.
std::size_t CountCodePoints(const std::string& text);

// Returns `count` copies of `c`.
// Throws std::length_error if `count` is larger than a std::string can hold.
std::string RepeatChar(char c, std::size_t count);

}  // namespace md_writer

#endif  // MD_WRITER_TEXT_UTIL_H
