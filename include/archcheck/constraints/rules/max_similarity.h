#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// Weighted Jaccard over exports, methods, classes and import basenames, in [0, 1].
// Dimensions empty on both sides are left out; two empty files score 0.
[[nodiscard]] double structural_similarity(const semantic::SemanticModel& a,
                                           const semantic::SemanticModel& b);

// E024: the file is not a near-duplicate of another file of the same architecture.
class MaxSimilarityValidator final : public ConstraintValidator {
 public:
  MaxSimilarityValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "max_similarity"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kMaxSimilarity; }
  [[nodiscard]] bool requires_project() const noexcept override { return true; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
