#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E004: listed modules must be imported; match "all" (default) or "any".
class RequireImportValidator final : public ConstraintValidator {
 public:
  RequireImportValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_import"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireImport; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
