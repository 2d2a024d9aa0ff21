#include "archcheck/constraints/rules/require_companion_file.h"

#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/text.h"

namespace archcheck::constraints {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
  for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos)) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Expands ${name}, ${name:kebab}, ${ext} and ${dir} relative to the source file.
std::string expand_companion_path(const std::string& pattern, const std::string& source_path) {
  const std::string dir = core::path_dirname(source_path);
  const std::string stem = core::path_stem(source_path);
  std::string extension = core::path_extension(source_path);
  if (!extension.empty()) {
    extension.erase(0, 1);
  }

  std::string expanded = pattern;
  replace_all(expanded, "${name:kebab}", core::to_kebab_case(stem));
  replace_all(expanded, "${name}", stem);
  replace_all(expanded, "${ext}", extension);
  replace_all(expanded, "${dir}", core::path_basename(dir));
  return core::normalize_path(dir.empty() ? expanded : dir + "/" + expanded);
}

bool is_exempt(const std::string& file_name) {
  return core::path_stem(file_name) == "index" || core::contains(file_name, ".test.") ||
         core::contains(file_name, ".spec.") || core::contains(file_name, ".stories.");
}

// "export * from './MyService.js'" or "export { X } from './MyService'".
bool exports_from(const std::string& companion_content, const std::string& stem) {
  auto compiled = compile_text_pattern("export\\s[^;]*from\\s*['\"]\\./" + escape_regex(stem) +
                                        "(?:\\.[A-Za-z]+)?['\"]");
  return compiled.has_value() && search(*compiled.value(), companion_content);
}

}  // namespace

ConstraintResult RequireCompanionFileValidator::validate(const registry::Constraint& constraint,
                                                         const ConstraintContext& context) const {
  if (context.project == nullptr || is_exempt(context.file_name)) {
    return {};
  }

  auto specs = constraint.companion_files;
  if (specs.empty()) {
    for (auto& path : registry::value_to_list(constraint.value)) {
      specs.push_back(registry::CompanionFileSpec{std::move(path), false});
    }
  }

  const std::string source_path = core::normalize_path(context.file_path);
  const std::string stem = core::path_stem(source_path);

  std::vector<Violation> violations;
  for (const auto& spec : specs) {
    const std::string companion = expand_companion_path(spec.path, source_path);
    const bool barrel = core::path_stem(companion) == "index";
    const auto content = context.project->read(companion);

    if (!content.has_value()) {
      auto violation = make_violation(
          constraint, context,
          "Missing companion file '" + companion + "' for '" + context.file_name + "'",
          std::nullopt, "Create '" + companion + "'");
      violation.suggestion = Suggestion{
          "add", companion, barrel ? "export * from './" + stem + "';" : companion, std::nullopt};
      violations.push_back(std::move(violation));
      continue;
    }

    if (spec.must_export && !exports_from(*content, stem)) {
      auto violation = make_violation(
          constraint, context,
          "Companion file '" + companion + "' does not export from './" + stem + "'",
          std::nullopt, "Add \"export * from './" + stem + "';\" to '" + companion + "'");
      violation.suggestion =
          Suggestion{"add", companion, "export * from './" + stem + "';", std::nullopt};
      violations.push_back(std::move(violation));
    }
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
