#pragma once

#include "archcheck/constraints/constraint_context.h"
#include "archcheck/constraints/violation.h"
#include "archcheck/registry/constraint.h"
#include "archcheck/semantic/language_adapter.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::constraints {

// ConstraintValidator is the abstract base class for every rule kind.
// Validators are stateless apart from constraint-derived memoization (compiled patterns), so
// one instance serves every thread.
class ConstraintValidator {
 public:
  virtual ~ConstraintValidator() = default;

  // Rule metadata
  [[nodiscard]] virtual std::string_view rule() const noexcept = 0;
  [[nodiscard]] virtual std::string_view error_code() const noexcept = 0;

  // False when the language lacks the construct the rule inspects. An inapplicable rule is
  // skipped, not reported as passing.
  [[nodiscard]] virtual bool applies_to(
      const semantic::LanguageCapabilities& /*capabilities*/) const noexcept {
    return true;
  }

  // Cross-file rules need ConstraintContext::project.
  [[nodiscard]] virtual bool requires_project() const noexcept { return false; }

  [[nodiscard]] virtual ConstraintResult validate(const registry::Constraint& constraint,
                                                  const ConstraintContext& context) const = 0;

 protected:
  ConstraintValidator() = default;
  ConstraintValidator(const ConstraintValidator&) = default;
  ConstraintValidator& operator=(const ConstraintValidator&) = default;
  ConstraintValidator(ConstraintValidator&&) = default;
  ConstraintValidator& operator=(ConstraintValidator&&) = default;

  // Violation carrying this rule's code plus the constraint's severity, why and source.
  [[nodiscard]] Violation make_violation(const registry::Constraint& constraint,
                                         const ConstraintContext& context, std::string message,
                                         std::optional<semantic::SourceLocation> location,
                                         std::string fix_hint) const;
};

// Canonical replacement named by the constraint's alternatives (first entry) or alternative.
[[nodiscard]] std::optional<DidYouMean> did_you_mean_for(const registry::Constraint& constraint);

// "Use an approved alternative: a, b" / "Use the approved alternative: x"; empty when the
// constraint names none.
[[nodiscard]] std::string alternatives_hint(const registry::Constraint& constraint);

// "Replace with 'x'" / "Replace with 'module' (use export)"; empty when the constraint names
// no alternative.
[[nodiscard]] std::string replace_with_hint(const registry::Constraint& constraint);

// "replace" pointing at the first alternative, or "remove" when the constraint names none.
// wildcard_import adds "import * from 'module';" for an alternative without an export.
[[nodiscard]] Suggestion replacement_suggestion(const registry::Constraint& constraint,
                                                const std::string& target,
                                                bool wildcard_import = false);

// "Repository<User>" -> "Repository".
[[nodiscard]] std::string strip_generics(std::string_view type_name);

// Exported classes, or every class when the file exports none.
[[nodiscard]] std::vector<const semantic::ClassInfo*> classes_under_check(
    const semantic::SemanticModel& model);

}  // namespace archcheck::constraints
