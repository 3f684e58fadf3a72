#include "code_fragments.h"
#include "text_util.h"

namespace md_writer {

namespace {
constexpr char kFence[] = "```";
}  // namespace

std::string code_fence(const std::optional<std::string>& info_string) {
    std::string fence = kFence;
    if (info_string) {
        fence += *info_string;
    }
    return fence;
}

std::string code_span(const std::string& code) {
    return "`" + code + "`";
}

// Closing fences never carry an info string.
std::string fenced_code_block(const std::string& code,
                              const std::optional<std::string>& info_string) {
    std::string block = code_fence(info_string);
    block += kLineFeed;
    block += code;
    block += kLineFeed;
    block += code_fence();
    return block;
}

std::string fenced_js_code_block(const std::string& code) {
    return fenced_code_block(code, "javascript");
}

std::string fenced_rs_code_block(const std::string& code) {
    return fenced_code_block(code, "rust");
}

std::string fenced_sh_code_block(const std::string& code) {
    return fenced_code_block(code, "shell");
}

std::string fenced_ts_code_block(const std::string& code) {
    return fenced_code_block(code, "typescript");
}

}  // namespace md_writer
