#include "markdown_converter.h"
#include <cmark.h>

#include <cstdlib>

namespace md_writer {
namespace markdown {

namespace {

// Minimal escaping for text placed inside <title>.
std::string EscapeHtml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

}  // namespace

// Use CMARK_OPT_SAFE to strip raw HTML
std::string ConvertToHtml(const std::string& markdown_input) {
    char* html = cmark_markdown_to_html(markdown_input.c_str(),
                                        markdown_input.size(),
                                        CMARK_OPT_SAFE);

    // Null Check:
    std::string result;
    if (html != nullptr){
        result = std::string(html);
        std::free(html);
    }

    return result;
}

std::string WrapInHtmlTemplate(const std::string& html_body, const std::string& title) {
    return "<!DOCTYPE html>\n"
           "<html lang=\"en\">\n"
           "<head>\n"
           "  <meta charset=\"UTF-8\">\n"
           "  <style>\n"
           "    body { font-family: sans-serif; padding: 2rem; line-height: 1.6; }\n"
           "    code { background: #f4f4f4; padding: 0.2rem 0.4rem; border-radius: 4px; }\n"
           "    pre { background: #f4f4f4; padding: 1rem; border-radius: 4px; overflow-x: auto; }\n"
           "  </style>\n"
           "  <title>" + EscapeHtml(title) + "</title>\n"
           "</head>\n"
           "<body>\n"
           + html_body +
           "\n</body>\n"
           "</html>\n";
}

}  // namespace markdown
}  // namespace md_writer
