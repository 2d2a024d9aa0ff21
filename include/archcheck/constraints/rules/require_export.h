#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E019: the file exports every listed name; '*' globs allowed.
class RequireExportValidator final : public ConstraintValidator {
 public:
  RequireExportValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_export"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireExport; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
