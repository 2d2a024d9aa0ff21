#pragma once

#include "archcheck/core/result.h"
#include "archcheck/semantic/language_adapter.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace archcheck::semantic {

/// One registered language: its adapter plus the capability flags that gate rules.
struct AdapterEntry {
  std::shared_ptr<const ILanguageAdapter> adapter;
  LanguageCapabilities capabilities{};
};

/// Extension-keyed adapter table (".ts" -> TypeScript adapter + capabilities).
/// Populated once at startup, then read concurrently.
class LanguageAdapterRegistry {
 public:
  /// Registers adapter for every extension (with leading dot, case-insensitive).
  /// A later registration for the same extension replaces the earlier one.
  void register_adapter(std::shared_ptr<const ILanguageAdapter> adapter,
                        const std::vector<std::string>& extensions,
                        LanguageCapabilities capabilities = {});

  /// Entry for path's extension, or nullptr when no language claims it.
  [[nodiscard]] const AdapterEntry* find_for_path(const std::string& path) const;

  [[nodiscard]] bool supports(const std::string& path) const {
    return find_for_path(path) != nullptr;
  }

  [[nodiscard]] std::vector<std::string> extensions() const;

  /// Dispatches to the adapter for path. Unknown extensions are an AdapterError.
  [[nodiscard]] core::Result<SemanticModel, AdapterError> parse_file(
      const std::string& path, const std::string& content) const;

 private:
  std::map<std::string, AdapterEntry> by_extension_;
};

}  // namespace archcheck::semantic
