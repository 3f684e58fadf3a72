#include "header_fragments.h"
#include "text_util.h"

namespace md_writer {

namespace {

std::string setext_header(const std::string& text, char underline_char) {
    std::string underline = RepeatChar(underline_char, CountCodePoints(text));

    std::string header;
    header.reserve(text.size() + 1 + underline.size());
    header += text;
    header += kLineFeed;
    header += underline;
    return header;
}

std::string atx_header(const std::string& text, std::size_t level) {
    return std::string(level, '#') + " " + text;
}

}  // namespace

std::string h1(const std::string& text) { return setext_header(text, '='); }
std::string h2(const std::string& text) { return setext_header(text, '-'); }

std::string h3(const std::string& text) { return atx_header(text, 3); }
std::string h4(const std::string& text) { return atx_header(text, 4); }
std::string h5(const std::string& text) { return atx_header(text, 5); }
std::string h6(const std::string& text) { return atx_header(text, 6); }

}  // namespace md_writer
