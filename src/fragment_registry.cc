#include "fragment_registry.h"

#include <algorithm>
#include <stdexcept>

namespace md_writer {

// Returns the single registry map, created on first call
std::unordered_map<std::string, FragmentRegistry::FragmentBuilder>&
FragmentRegistry::registry() {
  static std::unordered_map<std::string, FragmentBuilder> map;
  return map;
}

// Store the builder under 'name'; skip if already exists.
bool FragmentRegistry::RegisterFragment(const std::string& name,
                                        FragmentBuilder builder) {
  auto& m = registry();
  if (m.count(name)) return false;  // duplicate registration not allowed
  m[name] = std::move(builder);
  return true;
}

// Look up 'name' and invoke its builder with the supplied args.
// Throws if no such fragment was registered.
std::string FragmentRegistry::BuildFragment(
    const std::string& name,
    const std::string& text,
    const std::optional<std::string>& info_string) {
  auto& m = registry();
  auto it = m.find(name);
  if (it == m.end()) {
    throw std::runtime_error("Unknown fragment: " + name);
  }
  return it->second(text, info_string);
}

bool FragmentRegistry::HasFragment(const std::string& name) {
    return registry().count(name) > 0;
}

std::vector<std::string> FragmentRegistry::FragmentNames() {
    std::vector<std::string> names;
    names.reserve(registry().size());
    for (const auto& entry : registry()) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace md_writer
