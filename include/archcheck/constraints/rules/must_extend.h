#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E001: every exported class extends the required base, directly or through its
// resolved inheritance chain. Generic parameters are ignored.
class MustExtendValidator final : public ConstraintValidator {
 public:
  MustExtendValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "must_extend"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kMustExtend; }
  [[nodiscard]] bool applies_to(
      const semantic::LanguageCapabilities& capabilities) const noexcept override {
    return capabilities.has_class_inheritance;
  }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
