#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E022: at least one alternative is present. Alternatives are dispatched by shape:
// "@intent:x" (file or function intent), "@tag" (inside a comment), "/re/" (content pattern)
// or a literal substring.
class RequireOneOfValidator final : public ConstraintValidator {
 public:
  RequireOneOfValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_one_of"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireOneOf; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
