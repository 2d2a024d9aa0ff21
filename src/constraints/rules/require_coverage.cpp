#include "archcheck/constraints/rules/require_coverage.h"

#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/glob.h"
#include "archcheck/core/text.h"

#include <algorithm>
#include <map>
#include <regex>

namespace archcheck::constraints {

namespace {

constexpr std::string_view kValuePlaceholder = "${value}";
constexpr std::string_view kDefaultExtractValues = "\"([^\"]+)\"";

struct CoverageSource {
  std::string value;
  std::string file;
  int line{1};
};

std::string apply_transform(const std::string& value, const std::optional<std::string>& transform) {
  if (!transform.has_value()) {
    return value;
  }
  const std::string& t = *transform;
  if (t == "PascalCase") {
    return core::to_pascal_case(value);
  }
  if (t == "camelCase") {
    return core::to_camel_case(value);
  }
  if (t == "kebab-case" || t == "kebab") {
    return core::to_kebab_case(value);
  }
  if (t == "snake_case" || t == "snake") {
    return core::to_snake_case(value);
  }
  if (t == "UPPER_CASE") {
    return core::to_upper_snake_case(value);
  }
  if (t == "lowercase" || t == "lower") {
    return core::normalize_ascii_lower(value);
  }
  if (t == "uppercase" || t == "upper") {
    return core::normalize_ascii_upper(value);
  }
  return value;
}

void extract_export_names(const std::string& content, const std::string& file,
                          const std::string& name_glob, std::vector<CoverageSource>& out) {
  static const std::regex kExport(
      R"(export\s+(?:const|let|var|function|class|type|interface)\s+(\w+))");
  const auto lines = core::split_lines(content);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    for (std::sregex_iterator it(lines[i].begin(), lines[i].end(), kExport), end; it != end;
         ++it) {
      const std::string name = (*it)[1].str();
      if (name_glob.empty() || core::glob_match(name_glob, name)) {
        out.push_back(CoverageSource{name, file, static_cast<int>(i) + 1});
      }
    }
  }
}

// The source pattern selects a region (capture group 1 when present); extract_values then
// pulls individual values out of it.
std::optional<PatternError> extract_string_literals(const std::string& content,
                                                    const std::string& file,
                                                    const registry::CoverageSpec& spec,
                                                    std::vector<CoverageSource>& out) {
  auto region_regex = compile_content_pattern(spec.source_pattern);
  if (!region_regex.has_value()) {
    return region_regex.error();
  }
  auto value_regex =
      compile_text_pattern(spec.extract_values.value_or(std::string(kDefaultExtractValues)));
  if (!value_regex.has_value()) {
    return value_regex.error();
  }

  const auto region = find_matches(*region_regex.value(), content, 1);
  if (region.empty()) {
    return std::nullopt;
  }
  for (auto& m : find_matches(*value_regex.value(), region.front().capture)) {
    std::string value = std::move(m.capture);
    const auto offset = content.find(value);
    const int line = offset == std::string::npos ? 1 : core::line_at_offset(content, offset);
    out.push_back(CoverageSource{std::move(value), file, line});
  }
  return std::nullopt;
}

bool handled(const std::string& value, const std::string& target_pattern,
             const std::map<std::string, std::string>& targets) {
  std::string search = target_pattern;
  for (auto pos = search.find(kValuePlaceholder); pos != std::string::npos;
       pos = search.find(kValuePlaceholder, pos)) {
    const std::string escaped = escape_regex(value);
    search.replace(pos, kValuePlaceholder.size(), escaped);
    pos += escaped.size();
  }
  auto compiled = compile_text_pattern(search);
  for (const auto& [path, content] : targets) {
    if (compiled.has_value() ? constraints::search(*compiled.value(), content)
                             : core::contains(content, value)) {
      return true;
    }
  }
  return false;
}

}  // namespace

ConstraintResult RequireCoverageValidator::validate(const registry::Constraint& constraint,
                                                    const ConstraintContext& context) const {
  if (context.project == nullptr) {
    return {};
  }
  if (!constraint.coverage.has_value()) {
    return make_result({make_violation(constraint, context,
                                       "require_coverage constraint has no coverage spec",
                                       std::nullopt,
                                       "Add source_type, source_pattern, in_files, "
                                       "target_pattern and in_target_files")});
  }
  const auto& spec = *constraint.coverage;
  const auto& project = *context.project;

  std::vector<CoverageSource> sources;
  for (const auto& file : project.list(spec.in_files)) {
    if (spec.source_type == "file_names") {
      const std::string name = core::path_basename(file);
      if (spec.source_pattern.empty() || core::glob_match(spec.source_pattern, name)) {
        sources.push_back(CoverageSource{core::path_stem(name), file, 1});
      }
      continue;
    }
    const auto content = project.read(file);
    if (!content.has_value()) {
      continue;
    }
    if (spec.source_type == "export_names") {
      extract_export_names(*content, file, spec.source_pattern, sources);
    } else if (spec.source_type == "string_literals") {
      if (auto error = extract_string_literals(*content, file, spec, sources); error) {
        return make_result({make_violation(constraint, context, error->message, std::nullopt,
                                           "Fix the coverage patterns in the architecture "
                                           "registry")});
      }
    } else {
      return make_result({make_violation(
          constraint, context, "Unknown coverage source_type '" + spec.source_type + "'",
          std::nullopt, "Use export_names, string_literals or file_names")});
    }
  }

  std::map<std::string, std::string> targets;
  for (const auto& file : project.list(spec.in_target_files)) {
    if (auto content = project.read(file); content.has_value()) {
      targets.emplace(file, std::move(*content));
    }
  }

  // A file that is itself a source only answers for its own values.
  const std::string self = core::normalize_path(context.file_path);
  const bool self_is_source = std::any_of(
      sources.begin(), sources.end(), [&](const CoverageSource& s) { return s.file == self; });

  std::vector<Violation> violations;
  for (const auto& source : sources) {
    if (self_is_source && source.file != self) {
      continue;
    }
    const std::string value = apply_transform(source.value, spec.transform);
    if (handled(value, spec.target_pattern, targets)) {
      continue;
    }
    std::string expected = spec.target_pattern;
    if (const auto pos = expected.find(kValuePlaceholder); pos != std::string::npos) {
      expected.replace(pos, kValuePlaceholder.size(), value);
    }
    std::optional<semantic::SourceLocation> location;
    if (source.file == self) {
      location = semantic::SourceLocation{source.line, 1};
    }
    violations.push_back(make_violation(
        constraint, context,
        "Coverage gap: '" + source.value + "' (" + source.file + ":" +
            std::to_string(source.line) + ") has no handler in " + spec.in_target_files,
        location, "Add a handler matching '" + expected + "' in " + spec.in_target_files));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
