#include "archcheck/validation/validation_engine.h"

#include "archcheck/constraints/condition_evaluator.h"
#include "archcheck/constraints/error_codes.h"
#include "archcheck/core/text.h"
#include "archcheck/core/version.h"
#include "archcheck/resolution/resolver.h"
#include "archcheck/storage/audit_event.h"
#include "archcheck/tags/override_policy.h"
#include "archcheck/tags/tag_parser.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <thread>
#include <tuple>
#include <utility>

namespace archcheck::validation {

namespace codes = constraints::codes;
using constraints::Violation;
using registry::Severity;

struct ValidationEngine::PreparedFile {
  std::string path;
  std::string content;
  tags::ParsedTags tags;
  const semantic::AdapterEntry* adapter{nullptr};
  std::optional<semantic::SemanticModel> model;
  std::optional<std::string> parse_error;
};

namespace {

constexpr std::size_t kMaxIntentSuggestions = 3;
constexpr double kIntentSimilarityThreshold = 0.5;

Violation engine_violation(const std::string_view code, std::string rule, std::string value,
                           const Severity severity, const std::optional<int> line,
                           std::string message, std::string source, std::string fix_hint = {}) {
  Violation v;
  v.code = std::string(code);
  v.rule = std::move(rule);
  v.value = std::move(value);
  v.severity = severity;
  v.line = line;
  if (line.has_value()) {
    v.column = 1;
  }
  v.message = std::move(message);
  v.source = std::move(source);
  v.fix_hint = std::move(fix_hint);
  return v;
}

std::string untagged_hint(const std::string& path) {
  const std::string lowered = core::normalize_ascii_lower(path);
  if (core::contains(lowered, "/generated/") || core::contains(lowered, ".generated.") ||
      core::contains(lowered, "/dist/")) {
    return "Generated files should be excluded from validation";
  }
  if (lowered.find('/') == std::string::npos &&
      (core::contains(lowered, ".config.ts") || core::contains(lowered, ".config.js"))) {
    return "Config files may need to be excluded or need an @arch tag";
  }
  return "Use /** @arch domain.name */ or // @arch domain.name";
}

std::string_view code_for(const resolution::ResolutionErrorKind kind) noexcept {
  switch (kind) {
    case resolution::ResolutionErrorKind::kArchitectureNotFound:
      return codes::kUnknownArchitecture;
    case resolution::ResolutionErrorKind::kCircularInheritance:
      return codes::kCircularInheritance;
    case resolution::ResolutionErrorKind::kMixinNotFound:
      return codes::kMissingMixin;
  }
  return codes::kUnknownArchitecture;
}

bool is_inline_mixin_conflict(const resolution::ConflictReport& conflict) {
  return conflict.rule == "mixin_inline_forbidden" || conflict.rule == "mixin_inline_only";
}

// Rule must match; then "*", the exact value, one entry of a list value, or the value quoted
// in the message.
bool override_matches(const tags::OverrideTag& tag, const Violation& violation) {
  if (tag.rule != violation.rule || tag.value.empty()) {
    return false;
  }
  if (tag.value == "*" || tag.value == violation.value) {
    return true;
  }
  const auto entries = core::split(violation.value, ',');
  if (std::find(entries.begin(), entries.end(), tag.value) != entries.end()) {
    return true;
  }
  return core::contains(violation.message, "'" + tag.value + "'");
}

std::vector<std::string> similar_intents(const std::string& name,
                                         const std::vector<std::string>& known) {
  std::vector<std::pair<double, std::string>> scored;
  for (const auto& candidate : known) {
    if (core::contains(candidate, name) || core::contains(name, candidate)) {
      scored.emplace_back(0.8, candidate);
      continue;
    }
    const double score = core::string_similarity(name, candidate);
    if (score > kIntentSimilarityThreshold) {
      scored.emplace_back(score, candidate);
    }
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });
  std::vector<std::string> names;
  for (std::size_t i = 0; i < scored.size() && i < kMaxIntentSuggestions; ++i) {
    names.push_back(scored[i].second);
  }
  return names;
}

void sort_findings(std::vector<Violation>& findings) {
  std::stable_sort(findings.begin(), findings.end(), [](const Violation& a, const Violation& b) {
    const int a_line = a.line.value_or(0);
    const int a_column = a.column.value_or(0);
    const int b_line = b.line.value_or(0);
    const int b_column = b.column.value_or(0);
    return std::tie(a_line, a_column, a.code) < std::tie(b_line, b_column, b.code);
  });
}

void set_status(ValidationResult& result) {
  sort_findings(result.violations);
  sort_findings(result.warnings);
  result.passed = result.violations.empty();
  if (!result.violations.empty()) {
    result.status = FileStatus::kFail;
  } else if (!result.warnings.empty()) {
    result.status = FileStatus::kWarn;
  } else {
    result.status = FileStatus::kPass;
  }
}

ValidationResult unchecked_result(const std::string& path, std::optional<std::string> arch_id,
                                  std::string reason) {
  ValidationResult result;
  result.file = path;
  result.arch_id = std::move(arch_id);
  result.status = FileStatus::kUnchecked;
  result.passed = false;
  result.unchecked_reason = std::move(reason);
  return result;
}

ValidationResult internal_error_result(const std::string& path, const std::string& what) {
  ValidationResult result;
  result.file = path;
  result.violations.push_back(engine_violation(codes::kInternalError, "internal_error", path,
                                               Severity::kError, std::nullopt,
                                               "Validation failed: " + what, "engine"));
  set_status(result);
  return result;
}

// Runs fn(i) for every i in [0, count) on up to `workers` threads. Indices are claimed in
// order; nothing new is claimed once stop is requested.
void parallel_for(const std::size_t count, const unsigned workers, const std::stop_token& stop,
                  const std::function<void(std::size_t)>& fn) {
  std::atomic<std::size_t> next{0};
  const auto worker = [&]() {
    while (!stop.stop_requested()) {
      const std::size_t i = next.fetch_add(1);
      if (i >= count) {
        return;
      }
      fn(i);
    }
  };
  if (workers <= 1) {
    worker();
    return;
  }
  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (unsigned w = 0; w < workers; ++w) {
    pool.emplace_back(worker);
  }
  for (auto& thread : pool) {
    thread.join();
  }
}

}  // namespace

ValidationEngine::ValidationEngine(EngineServices& services, ValidationConfig config)
    : services_(services), config_(std::move(config)) {}

ValidationEngine::PreparedFile ValidationEngine::prepare(const std::string& path,
                                                         const std::string& content) const {
  PreparedFile file;
  file.path = path;
  file.content = content;
  file.tags = tags::parse_tags(content, core::path_extension(path));
  if (!file.tags.arch.has_value()) {
    return file;
  }
  file.adapter = services_.adapters.find_for_path(path);
  if (file.adapter == nullptr || file.adapter->adapter == nullptr) {
    return file;
  }
  auto parsed = file.adapter->adapter->parse_file(path, content);
  if (parsed.has_value()) {
    file.model = parsed.take_value();
  } else {
    file.parse_error = parsed.error().message;
  }
  return file;
}

ValidationResult ValidationEngine::evaluate(const PreparedFile& file, const std::string& today,
                                            const constraints::IProjectView* project) const {
  // ── Untagged ─────────────────────────────────────────────────────────────
  if (!file.tags.arch.has_value()) {
    ValidationResult result;
    result.file = file.path;
    result.status = FileStatus::kUntagged;
    const std::string message = "Missing @arch tag. " + untagged_hint(file.path);
    switch (config_.untagged_policy) {
      case UntaggedPolicy::kDeny:
        result.violations.push_back(engine_violation(codes::kUntagged, "untagged", "@arch",
                                                     Severity::kError, std::nullopt, message,
                                                     "config"));
        result.passed = false;
        break;
      case UntaggedPolicy::kWarn:
        result.warnings.push_back(engine_violation(codes::kUntagged, "untagged", "@arch",
                                                   Severity::kWarning, std::nullopt, message,
                                                   "config"));
        break;
      case UntaggedPolicy::kAllow:
        break;
    }
    return result;
  }

  const tags::ArchTag& arch_tag = *file.tags.arch;
  if (file.adapter == nullptr) {
    return unchecked_result(file.path, arch_tag.arch_id,
                            "No language adapter registered for '" +
                                core::path_extension(file.path) + "' files");
  }
  if (!file.model.has_value()) {
    return unchecked_result(file.path, arch_tag.arch_id,
                            "Could not parse file: " + file.parse_error.value_or("unknown error"));
  }
  const semantic::SemanticModel& model = *file.model;

  ValidationResult result;
  result.file = file.path;
  result.arch_id = arch_tag.arch_id;

  // ── Resolve ──────────────────────────────────────────────────────────────
  resolution::ResolveOptions options;
  options.inline_mixins = arch_tag.inline_mixins;
  auto resolved = resolution::resolve_architecture(services_.registry, arch_tag.arch_id, options);
  if (!resolved.has_value()) {
    const auto& error = resolved.error();
    result.violations.push_back(engine_violation(code_for(error.kind), "resolution",
                                                 arch_tag.arch_id, Severity::kError,
                                                 arch_tag.line, error.message, "registry"));
    set_status(result);
    return result;
  }
  resolution::ResolutionResult resolution = resolved.take_value();
  const resolution::FlattenedArchitecture& arch = resolution.architecture;
  result.inheritance_chain = arch.inheritance_chain;
  result.mixins_applied = arch.applied_mixins;
  result.conflicts = resolution.conflicts;

  std::vector<Violation> findings;

  // ── Architecture-level findings ──────────────────────────────────────────
  for (const auto& conflict : resolution.conflicts) {
    if (is_inline_mixin_conflict(conflict)) {
      findings.push_back(engine_violation(codes::kMixinOrSingleton, conflict.rule,
                                          conflict.value, Severity::kWarning, arch_tag.line,
                                          conflict.resolution, conflict.winner));
    }
  }

  if (arch.deprecated_from.has_value()) {
    findings.push_back(engine_violation(
        codes::kDeprecatedArchitecture, "deprecated_architecture", arch_tag.arch_id,
        Severity::kWarning, arch_tag.line,
        "Architecture '" + arch_tag.arch_id + "' is deprecated since " + *arch.deprecated_from,
        arch_tag.arch_id,
        arch.migration_guide.has_value() ? "See migration guide: " + *arch.migration_guide
                                         : "Migrate to a supported architecture"));
  }

  for (const auto& expected : arch.expected_intents) {
    const bool declared = std::any_of(
        file.tags.intents.begin(), file.tags.intents.end(),
        [&](const tags::IntentAnnotation& intent) { return intent.name == expected; });
    if (!declared) {
      findings.push_back(engine_violation(
          codes::kMissingExpectedIntent, "missing_expected_intent", expected, Severity::kWarning,
          arch_tag.line,
          "Architecture '" + arch_tag.arch_id + "' expects @intent:" + expected +
              " but file lacks it",
          arch_tag.arch_id, "Add @intent:" + expected + " to the file header"));
    }
  }

  if (config_.known_intents.has_value()) {
    const auto& known = *config_.known_intents;
    for (const auto& intent : file.tags.intents) {
      if (std::find(known.begin(), known.end(), intent.name) != known.end()) {
        continue;
      }
      const auto similar = similar_intents(intent.name, known);
      const std::string suggestion =
          similar.empty() ? " Add it to the intent vocabulary"
                          : " Did you mean: " + core::join(similar, ", ") + "?";
      findings.push_back(engine_violation(
          codes::kUnknownIntent, "unknown_intent", intent.name,
          config_.unknown_intent_is_error ? Severity::kError : Severity::kWarning, intent.line,
          "Unknown intent '@intent:" + intent.name + "'." + suggestion, "intent-registry"));
    }
  }

  // ── Constraints ──────────────────────────────────────────────────────────
  const auto file_intents = tags::file_level_intent_names(file.tags);
  const constraints::ConstraintContext base{file.path,         core::path_basename(file.path),
                                            arch_tag.arch_id,  arch_tag.arch_id,
                                            model,             file_intents,
                                            file.tags.intents, project};

  for (const auto& constraint : arch.constraints) {
    const std::string value = registry::value_to_string(constraint.value);
    const auto skip = [&](const SkipReason reason, std::string detail) {
      result.skipped.push_back(
          SkippedConstraint{constraint.rule, value, constraint.source, reason, std::move(detail)});
    };

    if (std::find(config_.skip_rules.begin(), config_.skip_rules.end(), constraint.rule) !=
        config_.skip_rules.end()) {
      skip(SkipReason::kFiltered, "Rule '" + constraint.rule + "' is skipped by configuration");
      continue;
    }
    if (!config_.severities.empty() &&
        std::find(config_.severities.begin(), config_.severities.end(), constraint.severity) ==
            config_.severities.end()) {
      skip(SkipReason::kFiltered, "Severity '" + std::string(registry::to_string(
                                                     constraint.severity)) +
                                      "' is filtered out");
      continue;
    }

    if (config_.missing_why != MissingWhyBehavior::kIgnore &&
        constraint.rule.rfind("forbid_", 0) == 0 && core::trim(constraint.why).empty()) {
      findings.push_back(engine_violation(
          codes::kMissingWhy, "missing_why", constraint.rule + ":" + value,
          config_.missing_why == MissingWhyBehavior::kError ? Severity::kError
                                                            : Severity::kWarning,
          arch_tag.line,
          "Constraint '" + constraint.rule +
              "' is missing 'why' field - explain why this is forbidden",
          constraint.source,
          "Add 'why: \"explanation\"' to the " + constraint.rule + " constraint in the registry"));
    }

    const constraints::ConstraintValidator* validator =
        services_.validators.find(constraint.rule);
    if (validator == nullptr) {
      skip(SkipReason::kNoValidator, "No validator registered for rule '" + constraint.rule + "'");
      continue;
    }
    if (!validator->applies_to(file.adapter->capabilities)) {
      skip(SkipReason::kCapability,
           "Language '" + std::string(file.adapter->adapter->language_id()) +
               "' lacks the construct '" + constraint.rule + "' inspects");
      continue;
    }

    if (constraint.applies_when.has_value()) {
      auto applies = constraints::evaluate_applies_when(*constraint.applies_when, model.content);
      if (!applies.has_value()) {
        findings.push_back(engine_violation(
            codes::kInvalidCondition, constraint.rule, value, Severity::kError, std::nullopt,
            "Invalid applies_when pattern: " + applies.error().message, constraint.source,
            "Fix the applies_when pattern in the architecture registry"));
        continue;
      }
      if (!applies.value()) {
        skip(SkipReason::kAppliesWhen,
             "applies_when pattern '" + *constraint.applies_when + "' not found");
        continue;
      }
    }

    if (!constraint.unless.empty()) {
      const auto outcome = constraints::evaluate_unless(constraint.unless, base);
      if (outcome.satisfied) {
        skip(SkipReason::kUnless, outcome.reason);
        continue;
      }
    }

    if (constraint.when.has_value()) {
      const auto outcome = constraints::evaluate_condition(*constraint.when, model, file.path);
      if (!outcome.satisfied) {
        skip(SkipReason::kCondition, outcome.reason);
        continue;
      }
    }

    if (validator->requires_project() && project == nullptr) {
      skip(SkipReason::kProjectContextRequired,
           "Rule '" + constraint.rule + "' needs the project file view");
      continue;
    }

    constraints::ConstraintContext context = base;
    context.constraint_source = constraint.source;
    try {
      auto outcome = validator->validate(constraint, context);
      for (auto& violation : outcome.violations) {
        findings.push_back(std::move(violation));
      }
    } catch (const std::regex_error& e) {
      findings.push_back(engine_violation(
          validator->error_code(), constraint.rule, value, constraint.severity, std::nullopt,
          std::string("Pattern evaluation failed: ") + e.what(), constraint.source,
          "Simplify the pattern in the architecture registry"));
    }
  }

  // ── Overrides ────────────────────────────────────────────────────────────
  std::vector<const tags::OverrideTag*> valid_overrides;
  std::vector<Violation> override_findings;
  for (const auto& tag : file.tags.overrides) {
    const auto check = tags::check_override(tag, config_.override_policy, today);
    if (check.valid) {
      valid_overrides.push_back(&tag);
      result.active_overrides.push_back(ActiveOverride{tag.rule, tag.value,
                                                       tag.reason.value_or(""), tag.expires,
                                                       tag.ticket, tag.approved_by, tag.line,
                                                       check.warnings, 0});
      continue;
    }
    for (const auto& error : check.errors) {
      override_findings.push_back(engine_violation(codes::kInvalidOverride, tag.rule, tag.value,
                                                   Severity::kError, tag.line, error,
                                                   "override"));
    }
    for (const auto& warning : check.warnings) {
      override_findings.push_back(engine_violation(codes::kInvalidOverride, tag.rule, tag.value,
                                                   Severity::kWarning, tag.line, warning,
                                                   "override"));
    }
  }
  if (config_.max_overrides_per_file > 0 &&
      file.tags.overrides.size() > static_cast<std::size_t>(config_.max_overrides_per_file)) {
    override_findings.push_back(engine_violation(
        codes::kOverrideLimit, "override_limit", std::to_string(file.tags.overrides.size()),
        Severity::kError, std::nullopt,
        "File has " + std::to_string(file.tags.overrides.size()) + " overrides, maximum is " +
            std::to_string(config_.max_overrides_per_file),
        "config"));
  }

  for (auto& violation : findings) {
    const auto it = std::find_if(
        valid_overrides.begin(), valid_overrides.end(),
        [&](const tags::OverrideTag* tag) { return override_matches(*tag, violation); });
    if (it != valid_overrides.end()) {
      const auto index = static_cast<std::size_t>(it - valid_overrides.begin());
      ++result.active_overrides[index].suppressed;
      continue;
    }
    override_findings.push_back(std::move(violation));
  }

  // ── Partition ────────────────────────────────────────────────────────────
  for (auto& violation : override_findings) {
    if (violation.severity == Severity::kError || config_.strict) {
      result.violations.push_back(std::move(violation));
    } else {
      result.warnings.push_back(std::move(violation));
    }
  }
  set_status(result);
  return result;
}

ValidationResult ValidationEngine::validate_file(const std::string& path,
                                                 const std::string& content) const {
  const std::string today = services_.clock.today_iso_date();
  ValidationResult result;
  try {
    result = evaluate(prepare(path, content), today, services_.project);
  } catch (const std::exception& e) {
    result = internal_error_result(path, e.what());
  }
  record_audit(result);
  return result;
}

BatchValidationResult ValidationEngine::validate_files(const std::vector<FileInput>& files,
                                                       std::stop_token stop) const {
  BatchValidationResult batch;
  const std::string today = services_.clock.today_iso_date();
  const unsigned workers =
      effective_concurrency(config_, files.size(), std::thread::hardware_concurrency());

  // Phase 1: tags and semantic models, so every file can see its peers.
  std::vector<std::optional<PreparedFile>> prepared(files.size());
  std::vector<std::optional<std::string>> failures(files.size());
  parallel_for(files.size(), workers, stop, [&](const std::size_t i) {
    try {
      prepared[i] = prepare(files[i].path, files[i].content);
    } catch (const std::exception& e) {
      failures[i] = e.what();
    }
  });

  std::optional<constraints::PeerOverlayView> overlay;
  const constraints::IProjectView* project = services_.project;
  if (project != nullptr) {
    std::vector<constraints::PeerFile> peers;
    for (const auto& file : prepared) {
      if (file.has_value() && file->model.has_value() && file->tags.arch.has_value()) {
        peers.push_back(
            constraints::PeerFile{file->path, file->tags.arch->arch_id, &*file->model});
      }
    }
    overlay.emplace(*project, std::move(peers));
    project = &*overlay;
  }

  // Phase 2: evaluation.
  std::vector<std::optional<ValidationResult>> slots(files.size());
  parallel_for(files.size(), workers, stop, [&](const std::size_t i) {
    if (failures[i].has_value()) {
      slots[i] = internal_error_result(files[i].path, *failures[i]);
      return;
    }
    if (!prepared[i].has_value()) {
      return;
    }
    try {
      slots[i] = evaluate(*prepared[i], today, project);
    } catch (const std::exception& e) {
      slots[i] = internal_error_result(files[i].path, e.what());
    }
  });

  batch.results.reserve(files.size());
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (slots[i].has_value()) {
      batch.results.push_back(std::move(*slots[i]));
    } else {
      batch.cancelled = true;
      batch.results.push_back(unchecked_result(files[i].path, std::nullopt, "Validation cancelled"));
    }
  }

  check_singletons(batch.results);
  for (auto& result : batch.results) {
    record_audit(result);
  }
  batch.summary = summarize(batch.results);
  return batch;
}

void ValidationEngine::check_singletons(std::vector<ValidationResult>& results) const {
  std::map<std::string, std::vector<std::size_t>> by_arch;
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (results[i].arch_id.has_value() && results[i].status != FileStatus::kUnchecked) {
      by_arch[*results[i].arch_id].push_back(i);
    }
  }
  for (const auto& [arch_id, indices] : by_arch) {
    const registry::ArchitectureNode* node = services_.registry.find_node(arch_id);
    if (node == nullptr || !node->singleton || indices.size() <= 1) {
      continue;
    }
    std::vector<std::string> names;
    names.reserve(indices.size());
    for (const auto i : indices) {
      names.push_back(core::path_basename(results[i].file));
    }
    const std::string message = "Architecture '" + arch_id + "' is marked singleton but is used by " +
                                std::to_string(indices.size()) + " files: " +
                                core::join(names, ", ");
    for (const auto i : indices) {
      results[i].violations.push_back(engine_violation(codes::kMixinOrSingleton,
                                                       "singleton_violation", arch_id,
                                                       Severity::kError, 1, message, "engine"));
      set_status(results[i]);
    }
  }
}

void ValidationEngine::record_audit(ValidationResult& result) const {
  if (services_.audit_log == nullptr) {
    return;
  }
  const std::string trace_id = services_.id_gen.next("trace");
  std::vector<std::string> refs{result.file};
  if (result.arch_id.has_value()) {
    refs.push_back(*result.arch_id);
  }

  std::vector<storage::AuditEvent> events;
  if (result.arch_id.has_value() && !result.inheritance_chain.empty()) {
    nlohmann::json payload;
    payload["arch_id"] = *result.arch_id;
    payload["conflict_count"] = result.conflicts.size();
    payload["inheritance_chain"] = result.inheritance_chain;
    payload["mixins_applied"] = result.mixins_applied;
    events.push_back({services_.id_gen.next("evt"), trace_id,
                      std::string(storage::event_types::kArchitectureResolved), payload.dump(),
                      services_.clock.now_iso8601(), refs});
  }
  for (const auto& active : result.active_overrides) {
    nlohmann::json payload;
    payload["line"] = active.line;
    payload["reason"] = active.reason;
    payload["rule"] = active.rule;
    payload["suppressed"] = active.suppressed;
    payload["value"] = active.value;
    events.push_back({services_.id_gen.next("evt"), trace_id,
                      std::string(storage::event_types::kOverrideApplied), payload.dump(),
                      services_.clock.now_iso8601(), refs});
  }
  nlohmann::json payload;
  payload["error_count"] = result.error_count();
  payload["skipped_count"] = result.skipped.size();
  payload["engine_version"] = core::kBuildVersion;
  payload["status"] = std::string(to_string(result.status));
  payload["warning_count"] = result.warning_count();
  events.push_back({services_.id_gen.next("evt"), trace_id,
                    std::string(storage::event_types::kFileValidated), payload.dump(),
                    services_.clock.now_iso8601(), refs});

  for (const auto& event : events) {
    auto appended = services_.audit_log->append(event);
    if (!appended.has_value()) {
      result.audit_error = appended.error();
      return;
    }
  }
}

}  // namespace archcheck::validation
