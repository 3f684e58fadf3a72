#ifndef MD_WRITER_MARKDOWN_CONVERTER_H
#define MD_WRITER_MARKDOWN_CONVERTER_H

#include <string>

namespace md_writer {
namespace markdown {

    // Renders a Markdown fragment to HTML using the cmark library.
    // Raw HTML in the input is omitted.
    std::string ConvertToHtml(const std::string& markdown_input);

    // Wraps the HTML in a full page with <html>, <head>, and <body> tags.
    std::string WrapInHtmlTemplate(const std::string& html_body,
                                   const std::string& title = "Markdown Preview");

}  // namespace markdown
}  // namespace md_writer

#endif  // MD_WRITER_MARKDOWN_CONVERTER_H
