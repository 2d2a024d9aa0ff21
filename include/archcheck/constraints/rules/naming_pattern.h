#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E007: the file name matches a raw pattern or a structured naming spec.
class NamingPatternValidator final : public ConstraintValidator {
 public:
  NamingPatternValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "naming_pattern"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kNamingPattern; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
