#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E016: no assignment, update or delete on the listed objects.
class ForbidMutationValidator final : public ConstraintValidator {
 public:
  ForbidMutationValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "forbid_mutation"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kForbidMutation; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
