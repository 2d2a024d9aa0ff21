#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E014: no call matches a forbidden call pattern. "@intent:x" entries in unless
// exempt calls made from a function (or file) declaring that intent.
class ForbidCallValidator final : public ConstraintValidator {
 public:
  ForbidCallValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "forbid_call"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kForbidCall; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
