#include "archcheck/validation/validation_json.h"

#include <string>

namespace archcheck::validation {

namespace {

using json = nlohmann::json;

json optional_int(const std::optional<int>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

json optional_string(const std::optional<std::string>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

std::optional<int> read_optional_int(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<int>();
}

json alternative_to_json(const registry::Alternative& alternative) {
  json j;
  j["description"] = alternative.description;
  j["example"] = alternative.example;
  j["export"] = alternative.export_name;
  j["module"] = alternative.module;
  return j;
}

json active_override_to_json(const ActiveOverride& active) {
  json j;
  j["approvedBy"] = optional_string(active.approved_by);
  j["expires"] = optional_string(active.expires);
  j["line"] = active.line;
  j["reason"] = active.reason;
  j["rule"] = active.rule;
  j["suppressed"] = active.suppressed;
  j["ticket"] = optional_string(active.ticket);
  j["value"] = active.value;
  j["warnings"] = active.warnings;
  return j;
}

json skipped_to_json(const SkippedConstraint& skipped) {
  json j;
  j["detail"] = skipped.detail;
  j["reason"] = std::string(to_string(skipped.reason));
  j["rule"] = skipped.rule;
  j["source"] = skipped.source;
  j["value"] = skipped.value;
  return j;
}

json violations_to_json(const std::vector<constraints::Violation>& violations) {
  json out = json::array();
  for (const auto& violation : violations) {
    out.push_back(violation_to_json(violation));
  }
  return out;
}

}  // namespace

json violation_to_json(const constraints::Violation& violation) {
  json j;
  j["code"] = violation.code;
  j["rule"] = violation.rule;
  j["value"] = violation.value;
  j["severity"] = std::string(registry::to_string(violation.severity));
  j["line"] = optional_int(violation.line);
  j["column"] = optional_int(violation.column);
  j["message"] = violation.message;
  j["why"] = violation.why;
  j["fixHint"] = violation.fix_hint;
  j["source"] = violation.source;

  if (violation.suggestion.has_value()) {
    json suggestion;
    suggestion["action"] = violation.suggestion->action;
    suggestion["target"] = violation.suggestion->target;
    suggestion["replacement"] = violation.suggestion->replacement;
    if (violation.suggestion->import_statement.has_value()) {
      suggestion["importStatement"] = *violation.suggestion->import_statement;
    }
    j["suggestion"] = suggestion;
  }
  if (violation.did_you_mean.has_value()) {
    json dym;
    dym["file"] = violation.did_you_mean->file;
    dym["export"] = violation.did_you_mean->export_name;
    dym["description"] = violation.did_you_mean->description;
    dym["example"] = violation.did_you_mean->example;
    j["didYouMean"] = dym;
  }
  if (!violation.alternatives.empty()) {
    json alternatives = json::array();
    for (const auto& alternative : violation.alternatives) {
      alternatives.push_back(alternative_to_json(alternative));
    }
    j["alternatives"] = alternatives;
  }
  return j;
}

constraints::Violation violation_from_json(const json& j) {
  constraints::Violation violation;
  violation.code = j.at("code").get<std::string>();
  violation.rule = j.at("rule").get<std::string>();
  violation.value = j.value("value", std::string{});
  const auto severity = j.at("severity").get<std::string>();
  violation.severity = registry::severity_from_string(severity).value_or(registry::Severity::kError);
  violation.line = read_optional_int(j, "line");
  violation.column = read_optional_int(j, "column");
  violation.message = j.at("message").get<std::string>();
  violation.why = j.value("why", std::string{});
  violation.fix_hint = j.value("fixHint", std::string{});
  violation.source = j.value("source", std::string{});

  if (j.contains("suggestion")) {
    const auto& s = j.at("suggestion");
    constraints::Suggestion suggestion;
    suggestion.action = s.at("action").get<std::string>();
    suggestion.target = s.value("target", std::string{});
    suggestion.replacement = s.value("replacement", std::string{});
    if (s.contains("importStatement")) {
      suggestion.import_statement = s.at("importStatement").get<std::string>();
    }
    violation.suggestion = std::move(suggestion);
  }
  if (j.contains("didYouMean")) {
    const auto& d = j.at("didYouMean");
    violation.did_you_mean =
        constraints::DidYouMean{d.value("file", std::string{}), d.value("export", std::string{}),
                                d.value("description", std::string{}),
                                d.value("example", std::string{})};
  }
  if (j.contains("alternatives")) {
    for (const auto& a : j.at("alternatives")) {
      violation.alternatives.push_back(registry::Alternative{
          a.value("module", std::string{}), a.value("export", std::string{}),
          a.value("description", std::string{}), a.value("example", std::string{})});
    }
  }
  return violation;
}

json conflict_to_json(const resolution::ConflictReport& conflict) {
  json j;
  j["loser"] = conflict.loser;
  j["resolution"] = conflict.resolution;
  j["rule"] = conflict.rule;
  j["severity"] = std::string(registry::to_string(conflict.severity));
  j["value"] = conflict.value;
  j["winner"] = conflict.winner;
  return j;
}

json validation_result_to_json(const ValidationResult& result) {
  json conflicts = json::array();
  for (const auto& conflict : result.conflicts) {
    conflicts.push_back(conflict_to_json(conflict));
  }
  json overrides = json::array();
  for (const auto& active : result.active_overrides) {
    overrides.push_back(active_override_to_json(active));
  }
  json skipped = json::array();
  for (const auto& entry : result.skipped) {
    skipped.push_back(skipped_to_json(entry));
  }

  json j;
  j["archId"] = optional_string(result.arch_id);
  j["auditError"] = optional_string(result.audit_error);
  j["conflicts"] = conflicts;
  j["errorCount"] = result.error_count();
  j["file"] = result.file;
  j["inheritanceChain"] = result.inheritance_chain;
  j["mixinsApplied"] = result.mixins_applied;
  j["overridesActive"] = overrides;
  j["passed"] = result.passed;
  j["skipped"] = skipped;
  j["status"] = std::string(to_string(result.status));
  j["uncheckedReason"] = optional_string(result.unchecked_reason);
  j["violations"] = violations_to_json(result.violations);
  j["warningCount"] = result.warning_count();
  j["warnings"] = violations_to_json(result.warnings);
  return j;
}

json batch_result_to_json(const BatchValidationResult& batch) {
  json results = json::array();
  for (const auto& result : batch.results) {
    results.push_back(validation_result_to_json(result));
  }
  json summary;
  summary["activeOverrides"] = batch.summary.active_overrides;
  summary["failed"] = batch.summary.failed;
  summary["passed"] = batch.summary.passed;
  summary["total"] = batch.summary.total;
  summary["totalErrors"] = batch.summary.total_errors;
  summary["totalWarnings"] = batch.summary.total_warnings;
  summary["unchecked"] = batch.summary.unchecked;
  summary["untagged"] = batch.summary.untagged;
  summary["warned"] = batch.summary.warned;

  json j;
  j["cancelled"] = batch.cancelled;
  j["results"] = results;
  j["summary"] = summary;
  return j;
}

}  // namespace archcheck::validation
