#include "builtin_fragments.h"
#include "code_fragments.h"
#include "header_fragments.h"

namespace md_writer {

namespace {

using Info = std::optional<std::string>;

// Adapts a text-only builder; the info string is ignored.
FragmentRegistry::FragmentBuilder TextOnly(std::string (*builder)(const std::string&)) {
  return [builder](const std::string& text, const Info& /*info_string*/) {
    return builder(text);
  };
}

}  // namespace

bool RegisterBuiltinFragments() {
  namespace n = fragment_names;
  bool ok = true;

  // A lone fence has no body; only the info string matters.
  ok &= FragmentRegistry::RegisterFragment(
      n::kCodeFence,
      [](const std::string& /*text*/, const Info& info_string) {
        return code_fence(info_string);
      });
  ok &= FragmentRegistry::RegisterFragment(n::kCodeSpan, TextOnly(code_span));
  ok &= FragmentRegistry::RegisterFragment(
      n::kFencedCodeBlock,
      [](const std::string& text, const Info& info_string) {
        return fenced_code_block(text, info_string);
      });
  ok &= FragmentRegistry::RegisterFragment(n::kFencedJs, TextOnly(fenced_js_code_block));
  ok &= FragmentRegistry::RegisterFragment(n::kFencedRs, TextOnly(fenced_rs_code_block));
  ok &= FragmentRegistry::RegisterFragment(n::kFencedSh, TextOnly(fenced_sh_code_block));
  ok &= FragmentRegistry::RegisterFragment(n::kFencedTs, TextOnly(fenced_ts_code_block));

  ok &= FragmentRegistry::RegisterFragment(n::kH1, TextOnly(h1));
  ok &= FragmentRegistry::RegisterFragment(n::kH2, TextOnly(h2));
  ok &= FragmentRegistry::RegisterFragment(n::kH3, TextOnly(h3));
  ok &= FragmentRegistry::RegisterFragment(n::kH4, TextOnly(h4));
  ok &= FragmentRegistry::RegisterFragment(n::kH5, TextOnly(h5));
  ok &= FragmentRegistry::RegisterFragment(n::kH6, TextOnly(h6));

  return ok;
}

}  // namespace md_writer
