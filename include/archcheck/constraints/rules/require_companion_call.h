#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E025: an operation on a target (db.insert("users")) is accompanied by the
// configured companion call.
class RequireCompanionCallValidator final : public ConstraintValidator {
 public:
  RequireCompanionCallValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_companion_call"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireCompanionCall; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
