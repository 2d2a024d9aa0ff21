#include "archcheck/constraints/rules/require_test_file.h"

#include "archcheck/core/glob.h"
#include "archcheck/core/text.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

std::string join_path(const std::string& dir, const std::string& name) {
  return dir.empty() ? name : dir + "/" + name;
}

}  // namespace

ConstraintResult RequireTestFileValidator::validate(const registry::Constraint& constraint,
                                                    const ConstraintContext& context) const {
  if (context.project == nullptr) {
    return {};
  }

  const std::string path = core::normalize_path(context.file_path);
  const std::string file_name = core::path_basename(path);
  const std::string stem = core::path_stem(path);
  const std::string extension = core::path_extension(path);

  auto patterns = registry::value_to_list(constraint.value);
  if (patterns.empty()) {
    patterns = {"*.test" + extension, "*.spec" + extension};
  }

  // Test files need no test file of their own.
  const bool is_test_file =
      std::any_of(patterns.begin(), patterns.end(),
                  [&](const std::string& p) { return core::glob_match(p, file_name); }) ||
      core::contains(file_name, ".test.") || core::contains(file_name, ".spec.");
  if (is_test_file) {
    return {};
  }

  const std::string dir = core::path_dirname(path);
  std::vector<std::string> candidates;
  for (const auto& pattern : patterns) {
    std::string name = pattern;
    const auto star = name.find('*');
    if (star != std::string::npos) {
      name.replace(star, 1, stem);
    }
    candidates.push_back(join_path(dir, name));
    candidates.push_back(join_path(dir, "__tests__/" + name));
  }

  if (std::any_of(candidates.begin(), candidates.end(),
                  [&](const std::string& c) { return context.project->exists(c); })) {
    return {};
  }

  auto violation = make_violation(
      constraint, context,
      "No companion test file found for '" + file_name + "' (looked for: " +
          core::join(candidates, ", ") + ")",
      std::nullopt, "Create a test file such as '" + candidates.front() + "'");
  violation.suggestion = Suggestion{"add", candidates.front(), "", std::nullopt};
  return make_result({std::move(violation)});
}

}  // namespace archcheck::constraints
