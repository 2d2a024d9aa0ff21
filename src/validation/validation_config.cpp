#include "archcheck/validation/validation_config.h"

#include <algorithm>

namespace archcheck::validation {

namespace {

using ConfigResult = core::Result<ValidationConfig, std::string>;

std::optional<UntaggedPolicy> untagged_policy_from_string(const std::string& text) {
  if (text == "allow") {
    return UntaggedPolicy::kAllow;
  }
  if (text == "warn") {
    return UntaggedPolicy::kWarn;
  }
  if (text == "deny") {
    return UntaggedPolicy::kDeny;
  }
  return std::nullopt;
}

std::optional<MissingWhyBehavior> missing_why_from_string(const std::string& text) {
  if (text == "ignore") {
    return MissingWhyBehavior::kIgnore;
  }
  if (text == "warning") {
    return MissingWhyBehavior::kWarning;
  }
  if (text == "error") {
    return MissingWhyBehavior::kError;
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(const UntaggedPolicy policy) noexcept {
  switch (policy) {
    case UntaggedPolicy::kAllow:
      return "allow";
    case UntaggedPolicy::kWarn:
      return "warn";
    case UntaggedPolicy::kDeny:
      return "deny";
  }
  return "allow";
}

std::string_view to_string(const MissingWhyBehavior behavior) noexcept {
  switch (behavior) {
    case MissingWhyBehavior::kIgnore:
      return "ignore";
    case MissingWhyBehavior::kWarning:
      return "warning";
    case MissingWhyBehavior::kError:
      return "error";
  }
  return "ignore";
}

unsigned effective_concurrency(const ValidationConfig& config, const std::size_t files,
                               const unsigned hardware_threads) {
  unsigned workers = config.concurrency;
  if (workers == 0) {
    workers = std::clamp((hardware_threads * 3) / 4, 1U, kMaxConcurrency);
  }
  const auto capped = std::min<std::size_t>(workers, std::max<std::size_t>(files, 1));
  return static_cast<unsigned>(capped);
}

core::Result<ValidationConfig, std::string> validation_config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return ConfigResult::err("Validation config must be a JSON object");
  }
  ValidationConfig config;
  try {
    const auto untagged = j.value("untagged_policy", std::string{"allow"});
    const auto policy = untagged_policy_from_string(untagged);
    if (!policy.has_value()) {
      return ConfigResult::err("Invalid untagged_policy '" + untagged +
                               "' (valid: allow, warn, deny)");
    }
    config.untagged_policy = *policy;

    const auto why = j.value("missing_why", std::string{"ignore"});
    const auto behavior = missing_why_from_string(why);
    if (!behavior.has_value()) {
      return ConfigResult::err("Invalid missing_why '" + why + "' (valid: ignore, warning, error)");
    }
    config.missing_why = *behavior;

    if (j.contains("overrides")) {
      const auto& o = j.at("overrides");
      config.override_policy.required_fields =
          o.value("required_fields", config.override_policy.required_fields);
      config.override_policy.warn_no_expiry =
          o.value("warn_no_expiry", config.override_policy.warn_no_expiry);
      config.override_policy.max_expiry_days =
          o.value("max_expiry_days", config.override_policy.max_expiry_days);
      config.override_policy.fail_on_expired =
          o.value("fail_on_expired", config.override_policy.fail_on_expired);
    }

    config.max_overrides_per_file = j.value("max_overrides_per_file", 0);
    if (config.max_overrides_per_file < 0) {
      return ConfigResult::err("max_overrides_per_file must not be negative");
    }
    config.strict = j.value("strict", false);
    config.skip_rules = j.value("skip_rules", std::vector<std::string>{});

    for (const auto& name : j.value("severities", std::vector<std::string>{})) {
      const auto severity = registry::severity_from_string(name);
      if (!severity.has_value()) {
        return ConfigResult::err("Invalid severity '" + name + "' (valid: info, warning, error)");
      }
      config.severities.push_back(*severity);
    }

    if (j.contains("known_intents") && !j.at("known_intents").is_null()) {
      config.known_intents = j.at("known_intents").get<std::vector<std::string>>();
    }
    config.unknown_intent_is_error = j.value("unknown_intent_is_error", false);
    config.concurrency = j.value("concurrency", 0U);
  } catch (const nlohmann::json::exception& e) {
    return ConfigResult::err(std::string("Invalid validation config: ") + e.what());
  }
  return ConfigResult::ok(std::move(config));
}

nlohmann::json validation_config_to_json(const ValidationConfig& config) {
  nlohmann::json overrides;
  overrides["fail_on_expired"] = config.override_policy.fail_on_expired;
  overrides["max_expiry_days"] = config.override_policy.max_expiry_days;
  overrides["required_fields"] = config.override_policy.required_fields;
  overrides["warn_no_expiry"] = config.override_policy.warn_no_expiry;

  nlohmann::json severities = nlohmann::json::array();
  for (const auto severity : config.severities) {
    severities.push_back(std::string(registry::to_string(severity)));
  }

  nlohmann::json j;
  j["concurrency"] = config.concurrency;
  j["known_intents"] = config.known_intents.has_value() ? nlohmann::json(*config.known_intents)
                                                        : nlohmann::json(nullptr);
  j["max_overrides_per_file"] = config.max_overrides_per_file;
  j["missing_why"] = std::string(to_string(config.missing_why));
  j["overrides"] = overrides;
  j["severities"] = severities;
  j["skip_rules"] = config.skip_rules;
  j["strict"] = config.strict;
  j["unknown_intent_is_error"] = config.unknown_intent_is_error;
  j["untagged_policy"] = std::string(to_string(config.untagged_policy));
  return j;
}

}  // namespace archcheck::validation
