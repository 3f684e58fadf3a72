// fragment_registry.h
#ifndef MD_WRITER_FRAGMENT_REGISTRY_H
#define MD_WRITER_FRAGMENT_REGISTRY_H

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace md_writer {

class FragmentRegistry {
public:
    // Builder signature: (text, info string) → Markdown fragment
    using FragmentBuilder =
        std::function<std::string(const std::string& /*text*/,
                                  const std::optional<std::string>& /*info_string*/)>;

    // Register a builder under a unique name. Returns false if already present.
    static bool RegisterFragment(const std::string& name, FragmentBuilder builder);

    // Build a fragment by name. Throws std::runtime_error if unknown.
    static std::string BuildFragment(const std::string& name,
                                     const std::string& text,
                                     const std::optional<std::string>& info_string = std::nullopt);

    // Check if any builder is registered under this name.
    static bool HasFragment(const std::string& name);

    // All registered names, sorted.
    static std::vector<std::string> FragmentNames();

private:
    // Returns the singleton map of name→builder
    static std::unordered_map<std::string, FragmentBuilder>& registry();
};

}  // namespace md_writer

#endif  // MD_WRITER_FRAGMENT_REGISTRY_H
