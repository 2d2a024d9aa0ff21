#pragma once

#include "archcheck/registry/constraint.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace archcheck::constraints {

// Machine-applicable fix. action is one of "add", "remove", "replace", "rename".
struct Suggestion {
  std::string action;
  std::string target;
  std::string replacement;
  // "import { X } from 'module';" when the replacement names an export.
  std::optional<std::string> import_statement;
};

// Canonical implementation to use instead of the offending construct.
struct DidYouMean {
  std::string file;
  std::string export_name;
  std::string description;
  std::string example;
};

// One failed constraint evaluation. Field names and meanings are a stable contract for every
// presentation layer; severity, why and source always come from the resolved Constraint.
struct Violation {
  std::string code;
  std::string rule;
  std::string value;
  registry::Severity severity{registry::Severity::kError};
  std::optional<int> line;
  std::optional<int> column;
  std::string message;
  std::string why;
  std::string fix_hint;
  std::string source;
  std::optional<Suggestion> suggestion;
  std::optional<DidYouMean> did_you_mean;
  std::vector<registry::Alternative> alternatives;
};

struct ConstraintResult {
  bool passed{true};
  std::vector<Violation> violations;
};

[[nodiscard]] inline ConstraintResult make_result(std::vector<Violation> violations) {
  const bool passed = violations.empty();
  return ConstraintResult{passed, std::move(violations)};
}

}  // namespace archcheck::constraints
