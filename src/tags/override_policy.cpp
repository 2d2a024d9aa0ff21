#include "archcheck/tags/override_policy.h"

#include "archcheck/core/text.h"

#include <chrono>
#include <regex>

namespace archcheck::tags {

namespace {

const std::regex kIsoDate(R"(^(\d{4})-(\d{2})-(\d{2})$)");

std::optional<std::chrono::sys_days> parse_iso_date(const std::string_view text) {
  const std::string value{text};
  std::smatch match;
  if (!std::regex_match(value, match, kIsoDate)) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{std::stoi(match[1].str())},
                                        std::chrono::month{static_cast<unsigned>(std::stoi(match[2].str()))},
                                        std::chrono::day{static_cast<unsigned>(std::stoi(match[3].str()))}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return std::chrono::sys_days{ymd};
}

const std::optional<std::string>* field_of(const OverrideTag& tag, const std::string& field) {
  if (field == "reason") {
    return &tag.reason;
  }
  if (field == "expires") {
    return &tag.expires;
  }
  if (field == "ticket") {
    return &tag.ticket;
  }
  if (field == "approved_by") {
    return &tag.approved_by;
  }
  return nullptr;
}

}  // namespace

std::optional<int> days_between(const std::string_view from, const std::string_view to) {
  const auto start = parse_iso_date(from);
  const auto stop = parse_iso_date(to);
  if (!start.has_value() || !stop.has_value()) {
    return std::nullopt;
  }
  return static_cast<int>((*stop - *start).count());
}

OverrideCheck check_override(const OverrideTag& tag, const OverridePolicy& policy,
                             const std::string_view today) {
  OverrideCheck check;
  const std::string subject = "Override for '" + tag.rule + "'";

  for (const auto& field : policy.required_fields) {
    const auto* value = field_of(tag, field);
    if (value != nullptr && (!value->has_value() || core::trim(**value).empty())) {
      check.errors.push_back(subject + " is missing required field '@" + field + "'");
    }
  }

  if (!tag.expires.has_value()) {
    if (policy.warn_no_expiry) {
      check.warnings.push_back(subject + " has no @expires date");
    }
  } else if (!parse_iso_date(*tag.expires).has_value()) {
    check.errors.push_back(subject + " has invalid @expires date '" + *tag.expires +
                           "' (expected YYYY-MM-DD)");
  } else if (const auto remaining = days_between(today, *tag.expires); remaining.has_value()) {
    if (*remaining < 0) {
      const std::string message = subject + " expired on " + *tag.expires;
      if (policy.fail_on_expired) {
        check.errors.push_back(message);
      } else {
        check.warnings.push_back(message);
        // Still not honored: an expired override never suppresses anything.
        check.valid = false;
      }
    } else if (policy.max_expiry_days > 0 && *remaining > policy.max_expiry_days) {
      check.errors.push_back(subject + " expires " + *tag.expires + ", more than " +
                             std::to_string(policy.max_expiry_days) + " days from " +
                             std::string(today));
    }
  }

  if (!check.errors.empty()) {
    check.valid = false;
  }
  return check;
}

}  // namespace archcheck::tags
