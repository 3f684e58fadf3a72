#ifndef MD_WRITER_CODE_FRAGMENTS_H
#define MD_WRITER_CODE_FRAGMENTS_H

#include <optional>
#include <string>

namespace md_writer {

    // Three backticks followed by the info string, if any.
    // An empty info string renders the same as no info string.
    // See https://spec.commonmark.org/0.30/#code-fence
    std::string code_fence(const std::optional<std::string>& info_string = std::nullopt);

    // Wraps code in single backticks. Embedded backticks are not escaped.
    // See https://spec.commonmark.org/0.30/#code-span
    std::string code_span(const std::string& code);

    // Opening fence (with info string), the code verbatim, then a bare closing
    // fence, joined by line feeds. The fence is always three backticks, even if
    // the code itself contains a line of backticks.
    // See https://spec.commonmark.org/0.30/#fenced-code-blocks
    std::string fenced_code_block(const std::string& code,
                                  const std::optional<std::string>& info_string = std::nullopt);

    // Fenced code blocks tagged "javascript", "rust", "shell" and "typescript".
    std::string fenced_js_code_block(const std::string& code);
    std::string fenced_rs_code_block(const std::string& code);
    std::string fenced_sh_code_block(const std::string& code);
    std::string fenced_ts_code_block(const std::string& code);

}  // namespace md_writer

#endif  // MD_WRITER_CODE_FRAGMENTS_H
