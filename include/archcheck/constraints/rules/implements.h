#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E002: every exported class implements the named interface.
class ImplementsValidator final : public ConstraintValidator {
 public:
  ImplementsValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "implements"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kImplements; }
  [[nodiscard]] bool applies_to(
      const semantic::LanguageCapabilities& capabilities) const noexcept override {
    return capabilities.has_interfaces;
  }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
