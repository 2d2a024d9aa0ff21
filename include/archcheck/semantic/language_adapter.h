#pragma once

#include "archcheck/core/result.h"
#include "archcheck/semantic/semantic_model.h"

#include <string>
#include <string_view>

namespace archcheck::semantic {

// Structural features a language offers. Validators consult these flags, never language
// names, when deciding whether a rule applies at all.
struct LanguageCapabilities {
  bool has_class_inheritance{true};
  bool has_interfaces{true};
  bool has_decorators{true};
  bool has_visibility_modifiers{true};
};

struct AdapterError {
  std::string message;
};

// Turns file text into a SemanticModel. One implementation per language, supplied by the
// embedding application. Implementations must be safe to call concurrently from several
// threads on different files.
class ILanguageAdapter {
 public:
  virtual ~ILanguageAdapter() = default;

  [[nodiscard]] virtual std::string_view language_id() const noexcept = 0;

  [[nodiscard]] virtual core::Result<SemanticModel, AdapterError> parse_file(
      const std::string& path, const std::string& content) const = 0;

 protected:
  ILanguageAdapter() = default;
  ILanguageAdapter(const ILanguageAdapter&) = default;
  ILanguageAdapter& operator=(const ILanguageAdapter&) = default;
  ILanguageAdapter(ILanguageAdapter&&) = default;
  ILanguageAdapter& operator=(ILanguageAdapter&&) = default;
};

}  // namespace archcheck::semantic
