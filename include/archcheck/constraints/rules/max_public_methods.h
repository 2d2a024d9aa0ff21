#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E009: no class exposes more public instance methods than the limit.
class MaxPublicMethodsValidator final : public ConstraintValidator {
 public:
  MaxPublicMethodsValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "max_public_methods"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kMaxPublicMethods; }
  [[nodiscard]] bool applies_to(
      const semantic::LanguageCapabilities& capabilities) const noexcept override {
    return capabilities.has_visibility_modifiers;
  }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
