#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E021: the content pattern matches nowhere in the file.
class ForbidPatternValidator final : public ConstraintValidator {
 public:
  ForbidPatternValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "forbid_pattern"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kForbidPattern; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
