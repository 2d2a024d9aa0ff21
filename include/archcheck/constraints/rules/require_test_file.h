#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E011: a companion test file exists for the source file.
class RequireTestFileValidator final : public ConstraintValidator {
 public:
  RequireTestFileValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_test_file"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireTestFile; }
  [[nodiscard]] bool requires_project() const noexcept override { return true; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
