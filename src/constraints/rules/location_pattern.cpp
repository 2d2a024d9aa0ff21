#include "archcheck/constraints/rules/location_pattern.h"

#include "archcheck/core/glob.h"
#include "archcheck/core/text.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

bool has_glob_syntax(const std::string& pattern) {
  return pattern.find_first_of("*?[{") != std::string::npos;
}

// Plain entries are directory prefixes, matched at the start of the path or after any '/'.
bool location_matches(const std::string& path, const std::string& entry) {
  if (has_glob_syntax(entry)) {
    return core::glob_match(entry, path);
  }
  std::string prefix = core::normalize_path(entry);
  if (!prefix.empty() && prefix.back() != '/') {
    prefix += '/';
  }
  return path.rfind(prefix, 0) == 0 || core::contains(path, "/" + prefix);
}

}  // namespace

ConstraintResult LocationPatternValidator::validate(const registry::Constraint& constraint,
                                                    const ConstraintContext& context) const {
  auto allowed = registry::value_to_list(constraint.value);
  if (constraint.pattern.has_value()) {
    allowed.push_back(*constraint.pattern);
  }
  // An empty entry would match every path.
  allowed.erase(std::remove_if(allowed.begin(), allowed.end(),
                               [](const std::string& entry) { return core::trim(entry).empty(); }),
                allowed.end());
  if (allowed.empty()) {
    return make_result({make_violation(constraint, context,
                                       "location_pattern requires at least one allowed location",
                                       std::nullopt,
                                       "List the allowed directories or globs for this file")});
  }

  const std::string path = core::normalize_path(context.file_path);
  if (std::any_of(allowed.begin(), allowed.end(),
                  [&](const std::string& entry) { return location_matches(path, entry); })) {
    return {};
  }

  const std::string listed = core::join(allowed, ", ");
  return make_result({make_violation(
      constraint, context,
      "File '" + path + "' is not in an allowed location (expected: " + listed + ")",
      semantic::SourceLocation{1, 1}, "Move the file under " + allowed.front())});
}

}  // namespace archcheck::constraints
