#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E005: every exported class carries the decorator.
class RequireDecoratorValidator final : public ConstraintValidator {
 public:
  RequireDecoratorValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_decorator"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireDecorator; }
  [[nodiscard]] bool applies_to(
      const semantic::LanguageCapabilities& capabilities) const noexcept override {
    return capabilities.has_decorators;
  }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
