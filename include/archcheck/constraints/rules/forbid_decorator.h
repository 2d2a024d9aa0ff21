#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E006: no class, method or function carries the decorator.
class ForbidDecoratorValidator final : public ConstraintValidator {
 public:
  ForbidDecoratorValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "forbid_decorator"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kForbidDecorator; }
  [[nodiscard]] bool applies_to(
      const semantic::LanguageCapabilities& capabilities) const noexcept override {
    return capabilities.has_decorators;
  }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
