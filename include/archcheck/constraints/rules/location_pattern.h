#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E008: the file lives under one of the given path globs or path prefixes.
class LocationPatternValidator final : public ConstraintValidator {
 public:
  LocationPatternValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "location_pattern"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kLocationPattern; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
