#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E003: no import (static or dynamic) of a listed module or any of its subpaths.
class ForbidImportValidator final : public ConstraintValidator {
 public:
  ForbidImportValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "forbid_import"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kForbidImport; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
