#include "archcheck/constraints/intent_resolver.h"

#include "archcheck/core/text.h"

#include <algorithm>
#include <utility>

namespace archcheck::constraints {

namespace {

constexpr std::string_view kIntentPrefix = "@intent:";

void attach_annotations(const ConstraintContext& context, FunctionScope& scope) {
  for (const auto& annotation : context.intent_annotations) {
    if (annotation.file_level) {
      continue;
    }
    if (annotation.line < scope.start_line &&
        annotation.line >= scope.start_line - kIntentAttachDistance &&
        !has_intent(scope.intents, annotation.name)) {
      scope.intents.push_back(annotation.name);
    }
  }
}

int scope_end(const int start_line, const int end_line) {
  return end_line >= start_line ? end_line : start_line;
}

}  // namespace

std::vector<FunctionScope> function_scopes(const ConstraintContext& context) {
  const auto& model = context.parsed_file;
  std::vector<FunctionScope> scopes;
  for (const auto& fn : model.functions) {
    FunctionScope scope{fn.name, fn.location.line, scope_end(fn.location.line, fn.end_line),
                        fn.intents};
    attach_annotations(context, scope);
    scopes.push_back(std::move(scope));
  }
  for (const auto& cls : model.classes) {
    for (const auto& method : cls.methods) {
      FunctionScope scope{cls.name + "." + method.name, method.location.line,
                          scope_end(method.location.line, method.end_line), method.intents};
      attach_annotations(context, scope);
      scopes.push_back(std::move(scope));
    }
  }
  return scopes;
}

const FunctionScope* find_containing_scope(const std::vector<FunctionScope>& scopes,
                                           const int line) {
  const FunctionScope* best = nullptr;
  for (const auto& scope : scopes) {
    if (line < scope.start_line || line > scope.end_line) {
      continue;
    }
    if (best == nullptr ||
        scope.end_line - scope.start_line < best->end_line - best->start_line) {
      best = &scope;
    }
  }
  return best;
}

std::vector<std::string> effective_intents_at(const ConstraintContext& context, const int line) {
  const auto scopes = function_scopes(context);
  const FunctionScope* scope = find_containing_scope(scopes, line);
  if (scope != nullptr && !scope->intents.empty()) {
    return scope->intents;
  }
  return context.intents;
}

std::vector<std::string> effective_intents_for_call(const ConstraintContext& context,
                                                    const semantic::FunctionCallInfo& call) {
  if (call.parent_function.has_value()) {
    const auto scopes = function_scopes(context);
    const std::string& parent = *call.parent_function;
    const auto it = std::find_if(scopes.begin(), scopes.end(), [&](const FunctionScope& scope) {
      if (scope.name == parent) {
        return true;
      }
      const auto dot = scope.name.rfind('.');
      return dot != std::string::npos && scope.name.substr(dot + 1) == parent;
    });
    if (it != scopes.end()) {
      return it->intents.empty() ? context.intents : it->intents;
    }
  }
  return effective_intents_at(context, call.location.line);
}

bool has_intent(const std::vector<std::string>& intents, const std::string_view name) {
  return std::any_of(intents.begin(), intents.end(),
                     [&](const std::string& intent) { return core::iequals(intent, name); });
}

bool has_intent_anywhere(const ConstraintContext& context, const std::string_view name) {
  if (has_intent(context.intents, name)) {
    return true;
  }
  const auto scopes = function_scopes(context);
  return std::any_of(scopes.begin(), scopes.end(),
                     [&](const FunctionScope& scope) { return has_intent(scope.intents, name); });
}

std::vector<std::string> unless_intents(const std::vector<std::string>& unless) {
  std::vector<std::string> names;
  for (const auto& entry : unless) {
    if (entry.size() > kIntentPrefix.size() &&
        entry.compare(0, kIntentPrefix.size(), kIntentPrefix) == 0) {
      names.push_back(entry.substr(kIntentPrefix.size()));
    }
  }
  return names;
}

}  // namespace archcheck::constraints
