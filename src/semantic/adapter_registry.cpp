#include "archcheck/semantic/adapter_registry.h"

#include "archcheck/core/text.h"

#include <utility>

namespace archcheck::semantic {

namespace {

std::string normalize_extension(const std::string& extension) {
  std::string lowered = core::normalize_ascii_lower(extension);
  if (!lowered.empty() && lowered.front() != '.') {
    lowered.insert(lowered.begin(), '.');
  }
  return lowered;
}

}  // namespace

void LanguageAdapterRegistry::register_adapter(std::shared_ptr<const ILanguageAdapter> adapter,
                                               const std::vector<std::string>& extensions,
                                               const LanguageCapabilities capabilities) {
  for (const auto& extension : extensions) {
    by_extension_[normalize_extension(extension)] = AdapterEntry{adapter, capabilities};
  }
}

const AdapterEntry* LanguageAdapterRegistry::find_for_path(const std::string& path) const {
  const std::string extension = normalize_extension(core::path_extension(path));
  if (extension.empty()) {
    return nullptr;
  }
  const auto it = by_extension_.find(extension);
  return it == by_extension_.end() ? nullptr : &it->second;
}

std::vector<std::string> LanguageAdapterRegistry::extensions() const {
  std::vector<std::string> out;
  out.reserve(by_extension_.size());
  for (const auto& [extension, _] : by_extension_) {
    out.push_back(extension);
  }
  return out;
}

core::Result<SemanticModel, AdapterError> LanguageAdapterRegistry::parse_file(
    const std::string& path, const std::string& content) const {
  const AdapterEntry* entry = find_for_path(path);
  if (entry == nullptr || !entry->adapter) {
    return core::Result<SemanticModel, AdapterError>::err(AdapterError{
        "No language adapter registered for extension '" + core::path_extension(path) + "'"});
  }
  return entry->adapter->parse_file(path, content);
}

}  // namespace archcheck::semantic
