#include "archcheck/constraints/condition_evaluator.h"

#include "archcheck/constraints/intent_resolver.h"
#include "archcheck/core/glob.h"

#include <algorithm>
#include <array>
#include <optional>
#include <regex>

namespace archcheck::constraints {

namespace {

std::string strip_at(const std::string& name) {
  return !name.empty() && name.front() == '@' ? name.substr(1) : name;
}

bool has_decorator_named(const std::vector<semantic::DecoratorInfo>& decorators,
                         const std::string& name) {
  return std::any_of(decorators.begin(), decorators.end(),
                     [&](const semantic::DecoratorInfo& d) { return d.name == name; });
}

bool class_has_decorator(const semantic::SemanticModel& model, const std::string& decorator) {
  const std::string name = strip_at(decorator);
  return std::any_of(model.classes.begin(), model.classes.end(),
                     [&](const semantic::ClassInfo& cls) {
                       return has_decorator_named(cls.decorators, name);
                     });
}

bool method_has_decorator(const semantic::SemanticModel& model, const std::string& decorator) {
  const std::string name = strip_at(decorator);
  for (const auto& cls : model.classes) {
    for (const auto& method : cls.methods) {
      if (has_decorator_named(method.decorators, name)) {
        return true;
      }
    }
  }
  return std::any_of(model.functions.begin(), model.functions.end(),
                     [&](const semantic::FunctionInfo& fn) {
                       return has_decorator_named(fn.decorators, name);
                     });
}

bool any_class_extends(const semantic::SemanticModel& model, const std::string& base) {
  return std::any_of(model.classes.begin(), model.classes.end(),
                     [&](const semantic::ClassInfo& cls) {
                       if (cls.extends == base) {
                         return true;
                       }
                       return std::find(cls.inheritance_chain.begin(),
                                        cls.inheritance_chain.end(),
                                        base) != cls.inheritance_chain.end();
                     });
}

bool any_class_implements(const semantic::SemanticModel& model, const std::string& iface) {
  return std::any_of(model.classes.begin(), model.classes.end(),
                     [&](const semantic::ClassInfo& cls) {
                       return std::find(cls.implements.begin(), cls.implements.end(), iface) !=
                              cls.implements.end();
                     });
}

bool specifier_matches_glob(const std::string& specifier, const std::string& pattern) {
  std::string source = "^";
  for (const char ch : pattern) {
    source += ch == '*' ? std::string(".*") : escape_regex(std::string(1, ch));
  }
  source += "$";
  auto compiled = compile_plain_pattern(source);
  return compiled.has_value() && std::regex_match(specifier, *compiled.value());
}

// One positive/negated check; returns the failure reason when the check does not hold.
std::optional<std::string> check(const std::optional<std::string>& positive,
                                 const std::optional<std::string>& negated, const bool found_pos,
                                 const bool found_neg, const std::string& what) {
  if (positive.has_value() && !found_pos) {
    return "No " + what + " '" + *positive + "'";
  }
  if (negated.has_value() && found_neg) {
    return "Found " + what + " '" + *negated + "' (negated condition not satisfied)";
  }
  return std::nullopt;
}

}  // namespace

bool file_has_import(const semantic::SemanticModel& model, const std::string& spec) {
  return std::any_of(model.imports.begin(), model.imports.end(),
                     [&](const semantic::ImportInfo& imp) {
                       if (spec.find('*') != std::string::npos) {
                         if (specifier_matches_glob(imp.module_specifier, spec)) {
                           return true;
                         }
                       } else if (imp.module_specifier == spec) {
                         return true;
                       }
                       if (std::find(imp.named_imports.begin(), imp.named_imports.end(), spec) !=
                           imp.named_imports.end()) {
                         return true;
                       }
                       return imp.default_import == spec;
                     });
}

bool file_has_decorator(const semantic::SemanticModel& model, const std::string& decorator) {
  return class_has_decorator(model, decorator) || method_has_decorator(model, decorator);
}

ConditionOutcome evaluate_condition(const registry::ConstraintCondition& condition,
                                    const semantic::SemanticModel& model,
                                    const std::string& file_path) {
  const auto opt_test = [](const std::optional<std::string>& value, auto&& predicate) {
    return value.has_value() && predicate(*value);
  };

  const auto class_dec = [&](const std::string& d) { return class_has_decorator(model, d); };
  const auto imports = [&](const std::string& s) { return file_has_import(model, s); };
  const auto extends = [&](const std::string& b) { return any_class_extends(model, b); };
  const auto implements = [&](const std::string& i) { return any_class_implements(model, i); };
  const auto path_matches = [&](const std::string& g) { return core::glob_match(g, file_path); };
  const auto method_dec = [&](const std::string& d) { return method_has_decorator(model, d); };

  const std::array<std::optional<std::string>, 6> failures{{
      check(condition.has_decorator, condition.not_has_decorator,
            opt_test(condition.has_decorator, class_dec),
            opt_test(condition.not_has_decorator, class_dec), "class decorator"),
      check(condition.has_import, condition.not_has_import,
            opt_test(condition.has_import, imports), opt_test(condition.not_has_import, imports),
            "import"),
      check(condition.extends, condition.not_extends, opt_test(condition.extends, extends),
            opt_test(condition.not_extends, extends), "class extending"),
      check(condition.implements, condition.not_implements,
            opt_test(condition.implements, implements),
            opt_test(condition.not_implements, implements), "class implementing"),
      check(condition.file_matches, condition.not_file_matches,
            opt_test(condition.file_matches, path_matches),
            opt_test(condition.not_file_matches, path_matches), "file path matching"),
      check(condition.method_has_decorator, condition.not_method_has_decorator,
            opt_test(condition.method_has_decorator, method_dec),
            opt_test(condition.not_method_has_decorator, method_dec),
            "method/function decorator"),
  }};
  for (const auto& failure : failures) {
    if (failure.has_value()) {
      return ConditionOutcome{false, *failure};
    }
  }
  return ConditionOutcome{true, "All conditions satisfied"};
}

ConditionOutcome evaluate_unless(const std::vector<std::string>& unless,
                                 const ConstraintContext& context) {
  const auto& model = context.parsed_file;
  for (const auto& entry : unless) {
    if (entry.rfind("@intent:", 0) == 0) {
      const std::string name = entry.substr(8);
      if (has_intent(context.intents, name)) {
        return ConditionOutcome{true, "File declares @intent:" + name};
      }
      continue;
    }
    if (entry.rfind("decorator:", 0) == 0) {
      const std::string name = entry.substr(10);
      if (file_has_decorator(model, name)) {
        return ConditionOutcome{true, "Found decorator @" + strip_at(name)};
      }
      continue;
    }
    const std::string spec = entry.rfind("import:", 0) == 0 ? entry.substr(7) : entry;
    if (!spec.empty() && file_has_import(model, spec)) {
      return ConditionOutcome{true, "Found import '" + spec + "'"};
    }
  }
  return ConditionOutcome{false, "No unless exception applies"};
}

core::Result<bool, PatternError> evaluate_applies_when(const std::string& pattern,
                                                       const std::string& content) {
  auto compiled = compile_content_pattern(pattern);
  if (!compiled.has_value()) {
    return core::Result<bool, PatternError>::err(compiled.error());
  }
  return core::Result<bool, PatternError>::ok(search(*compiled.value(), content));
}

}  // namespace archcheck::constraints
