#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E010: the file has at most value lines.
class MaxFileLinesValidator final : public ConstraintValidator {
 public:
  MaxFileLinesValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "max_file_lines"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kMaxFileLines; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
