#pragma once

#include "archcheck/constraints/constraint_context.h"

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::constraints {

// A function or method body with the intents that apply inside it.
struct FunctionScope {
  std::string name;  // "fn" or "Class.method"
  int start_line{0};
  int end_line{0};
  std::vector<std::string> intents;
};

// Annotations within this many lines above a function attach to it.
inline constexpr int kIntentAttachDistance = 3;

// Functions and methods of the file. Intents come from the model plus any non-header
// @intent annotation directly above the declaration.
[[nodiscard]] std::vector<FunctionScope> function_scopes(const ConstraintContext& context);

// Innermost scope spanning line, or nullptr at module scope.
[[nodiscard]] const FunctionScope* find_containing_scope(const std::vector<FunctionScope>& scopes,
                                                         int line);

// Intents of the innermost enclosing function when it declares any, else the file's.
[[nodiscard]] std::vector<std::string> effective_intents_at(const ConstraintContext& context,
                                                            int line);

// Same as effective_intents_at, resolving the call's parent function by name first.
[[nodiscard]] std::vector<std::string> effective_intents_for_call(
    const ConstraintContext& context, const semantic::FunctionCallInfo& call);

// Case-insensitive membership.
[[nodiscard]] bool has_intent(const std::vector<std::string>& intents, std::string_view name);

// File-level intent or any function-level intent.
[[nodiscard]] bool has_intent_anywhere(const ConstraintContext& context, std::string_view name);

// Names from "@intent:x" entries of an unless list.
[[nodiscard]] std::vector<std::string> unless_intents(const std::vector<std::string>& unless);

}  // namespace archcheck::constraints
