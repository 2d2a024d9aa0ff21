#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E026: companion files derived from the source path exist and, optionally, re-export
// the source file.
class RequireCompanionFileValidator final : public ConstraintValidator {
 public:
  RequireCompanionFileValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_companion_file"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireCompanionFile; }
  [[nodiscard]] bool requires_project() const noexcept override { return true; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
