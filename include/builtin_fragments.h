// builtin_fragments.h
#ifndef MD_WRITER_BUILTIN_FRAGMENTS_H
#define MD_WRITER_BUILTIN_FRAGMENTS_H

#include "fragment_registry.h"

namespace md_writer {

// Names the built-in builders register under
namespace fragment_names {
    constexpr char kCodeFence[]       = "code-fence";
    constexpr char kCodeSpan[]        = "code-span";
    constexpr char kFencedCodeBlock[] = "fenced-code-block";
    constexpr char kFencedJs[]        = "fenced-js";
    constexpr char kFencedRs[]        = "fenced-rs";
    constexpr char kFencedSh[]        = "fenced-sh";
    constexpr char kFencedTs[]        = "fenced-ts";
    constexpr char kH1[]              = "h1";
    constexpr char kH2[]              = "h2";
    constexpr char kH3[]              = "h3";
    constexpr char kH4[]              = "h4";
    constexpr char kH5[]              = "h5";
    constexpr char kH6[]              = "h6";
}  // namespace fragment_names

// Registers every code and header builder. Returns false if any name was
// already taken.
bool RegisterBuiltinFragments();

// one-time registration at load time:
inline bool _builtin_fragments_registered = RegisterBuiltinFragments();

}  // namespace md_writer

#endif  // MD_WRITER_BUILTIN_FRAGMENTS_H
