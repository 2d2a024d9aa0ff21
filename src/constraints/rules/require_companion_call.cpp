#include "archcheck/constraints/rules/require_companion_call.h"

#include "archcheck/constraints/call_matcher.h"
#include "archcheck/core/glob.h"
#include "archcheck/core/text.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

std::string strip_quotes(std::string text) {
  text = core::trim(text);
  if (text.size() >= 2) {
    const char q = text.front();
    if ((q == '"' || q == '\'' || q == '`') && text.back() == q) {
      return text.substr(1, text.size() - 2);
    }
  }
  return text;
}

// Target of an operation: first argument ("db.insert('users')") or, in method-chain mode,
// the receiver with chain_base stripped ("prisma.users.create()" -> "users").
std::optional<std::string> detect_target(const registry::CompanionCallSpec& spec,
                                         const semantic::FunctionCallInfo& call) {
  if (spec.detection == registry::TargetDetection::kFirstArgument) {
    if (call.arguments.empty()) {
      return std::nullopt;
    }
    return strip_quotes(call.arguments.front());
  }
  if (!call.receiver.has_value()) {
    return std::nullopt;
  }
  std::string receiver = *call.receiver;
  if (spec.chain_base.has_value()) {
    const std::string base = *spec.chain_base + ".";
    if (receiver.rfind(base, 0) != 0) {
      return std::nullopt;
    }
    receiver = receiver.substr(base.size());
    const auto dot = receiver.find('.');
    return dot == std::string::npos ? receiver : receiver.substr(0, dot);
  }
  const auto dot = receiver.rfind('.');
  return dot == std::string::npos ? receiver : receiver.substr(dot + 1);
}

bool companion_matches(const std::string& pattern, const semantic::FunctionCallInfo& call) {
  return call_matches(pattern, call) || call.method_name == pattern;
}

std::string location_text(const registry::CompanionLocation location) {
  switch (location) {
    case registry::CompanionLocation::kSameFunction:
      return "in the same function";
    case registry::CompanionLocation::kAfter:
      return "after it in the same function";
    case registry::CompanionLocation::kSameFile:
      return "in the same file";
  }
  return "in the same file";
}

}  // namespace

ConstraintResult RequireCompanionCallValidator::validate(const registry::Constraint& constraint,
                                                         const ConstraintContext& context) const {
  if (!constraint.companion_call.has_value() || constraint.companion_call->rules.empty()) {
    return make_result({make_violation(constraint, context,
                                       "require_companion_call has no companion rules",
                                       std::nullopt,
                                       "Add target, operations and call to the constraint")});
  }
  const auto& spec = *constraint.companion_call;
  const auto& calls = context.parsed_file.function_calls;

  const auto has_companion = [&](const semantic::FunctionCallInfo& operation,
                                 const std::string& companion) {
    return std::any_of(calls.begin(), calls.end(), [&](const semantic::FunctionCallInfo& other) {
      if (&other == &operation || !companion_matches(companion, other)) {
        return false;
      }
      switch (spec.location) {
        case registry::CompanionLocation::kSameFile:
          return true;
        case registry::CompanionLocation::kSameFunction:
          return other.parent_function == operation.parent_function;
        case registry::CompanionLocation::kAfter:
          return other.parent_function == operation.parent_function &&
                 (other.location.line > operation.location.line ||
                  (other.location.line == operation.location.line &&
                   other.location.column > operation.location.column));
      }
      return false;
    });
  };

  std::vector<Violation> violations;
  for (const auto& call : calls) {
    const auto target = detect_target(spec, call);
    if (!target.has_value()) {
      continue;
    }
    for (const auto& rule : spec.rules) {
      const bool target_hit = rule.target == "*" || rule.target == *target ||
                              (rule.target.find('*') != std::string::npos &&
                               core::glob_match(rule.target, *target));
      if (!target_hit) {
        continue;
      }
      const bool operation_hit =
          rule.operations.empty() || std::find(rule.operations.begin(), rule.operations.end(),
                                               call.method_name) != rule.operations.end();
      if (!operation_hit || has_companion(call, rule.call)) {
        continue;
      }
      auto violation = make_violation(
          constraint, context,
          "Operation '" + call.method_name + "(" + *target + ")' requires a companion call to '" +
              rule.call + "' " + location_text(spec.location),
          call.location, "Call '" + rule.call + "' after '" + call.callee + "'");
      violation.suggestion = Suggestion{"add", call.callee, rule.call + "()", std::nullopt};
      violations.push_back(std::move(violation));
    }
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
