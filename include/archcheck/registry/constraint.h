#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace archcheck::registry {

// Ordered by strictness so std::max picks the stricter of two severities.
enum class Severity {
  kInfo = 0,
  kWarning = 1,
  kError = 2,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::optional<Severity> severity_from_string(std::string_view text);

enum class MatchMode {
  kAll,
  kAny,
};

// Structured file-name pattern. Absent fields are not checked; a missing case defaults to
// PascalCase once at least one field is present.
struct NamingSpec {
  std::optional<std::string> case_style;
  std::optional<std::string> prefix;
  std::optional<std::string> suffix;
  std::optional<std::string> extension;
};

// Structural precondition evaluated against the SemanticModel. Every set field must hold.
struct ConstraintCondition {
  std::optional<std::string> has_decorator;
  std::optional<std::string> not_has_decorator;
  std::optional<std::string> has_import;
  std::optional<std::string> not_has_import;
  std::optional<std::string> extends;
  std::optional<std::string> not_extends;
  std::optional<std::string> implements;
  std::optional<std::string> not_implements;
  std::optional<std::string> file_matches;
  std::optional<std::string> not_file_matches;
  std::optional<std::string> method_has_decorator;
  std::optional<std::string> not_method_has_decorator;
};

// Suggested replacement for a forbidden construct.
struct Alternative {
  std::string module;
  std::string export_name;
  std::string description;
  std::string example;
};

// require_coverage: every source value discovered in in_files must be handled somewhere
// in in_target_files, found by target_pattern with "${value}" substituted.
struct CoverageSpec {
  std::string source_type;  // export_names | string_literals | file_names
  std::string source_pattern;
  std::optional<std::string> extract_values;
  std::string in_files;
  std::string target_pattern;
  std::optional<std::string> transform;
  std::string in_target_files;
};

struct CompanionCallRule {
  std::string target;
  std::vector<std::string> operations;
  std::string call;
};

enum class CompanionLocation {
  kSameFile,
  kSameFunction,
  kAfter,
};

enum class TargetDetection {
  kFirstArgument,  // db.insert("users", ...) -> "users"
  kMethodChain,    // prisma.users.create(...) -> "users"
};

struct CompanionCallSpec {
  std::vector<CompanionCallRule> rules;
  CompanionLocation location{CompanionLocation::kSameFile};
  TargetDetection detection{TargetDetection::kFirstArgument};
  std::optional<std::string> chain_base;  // receiver prefix stripped in method-chain mode
};

// Path template with ${name}, ${name:kebab}, ${ext} and ${dir} placeholders.
struct CompanionFileSpec {
  std::string path;
  bool must_export{false};
};

using ConstraintValue = std::variant<std::monostate, std::string, std::vector<std::string>, double>;

struct Constraint {
  std::string rule;
  ConstraintValue value{};
  Severity severity{Severity::kError};
  std::string why;
  // Originating architecture id, or "mixin:<id>". Filled in by the resolver.
  std::string source;
  std::optional<std::string> category;

  // Rule-specific payload.
  std::optional<std::string> pattern;
  std::optional<NamingSpec> naming;
  std::vector<std::string> examples;
  std::vector<std::string> around;
  std::vector<std::string> before;
  MatchMode match{MatchMode::kAll};
  bool exclude_comments{false};
  std::optional<CoverageSpec> coverage;
  std::optional<CompanionCallSpec> companion_call;
  std::vector<CompanionFileSpec> companion_files;

  // Conditions, passed through the resolver unevaluated.
  std::optional<ConstraintCondition> when;
  std::vector<std::string> unless;
  std::optional<std::string> applies_when;

  // Remediation.
  std::optional<std::string> alternative;
  std::vector<Alternative> alternatives;

  // Replaces every inherited constraint with the same rule.
  bool override_inherited{false};
};

// Display form: strings verbatim, lists joined with ",", numbers without trailing zeros.
[[nodiscard]] std::string value_to_string(const ConstraintValue& value);

// Strings become a single-element list; numbers their display form; empty for unset.
[[nodiscard]] std::vector<std::string> value_to_list(const ConstraintValue& value);

// Numbers as-is; strings parsed when fully numeric.
[[nodiscard]] std::optional<double> value_to_number(const ConstraintValue& value);

[[nodiscard]] std::string format_number(double number);

}  // namespace archcheck::registry
