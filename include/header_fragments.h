#ifndef MD_WRITER_HEADER_FRAGMENTS_H
#define MD_WRITER_HEADER_FRAGMENTS_H

#include <string>

namespace md_writer {

    // Setext headers: the text, a line feed, then one '=' (h1) or '-' (h2) per
    // code point of the text.
    // Throws std::length_error if the underline cannot fit in a std::string.
    // See https://spec.commonmark.org/0.30/#setext-headings
    std::string h1(const std::string& text);
    std::string h2(const std::string& text);

    // ATX headers: 3 to 6 '#' characters, a space, then the text.
    // See https://spec.commonmark.org/0.30/#atx-heading
    std::string h3(const std::string& text);
    std::string h4(const std::string& text);
    std::string h5(const std::string& text);
    std::string h6(const std::string& text);

}  // namespace md_writer

#endif  // MD_WRITER_HEADER_FRAGMENTS_H
