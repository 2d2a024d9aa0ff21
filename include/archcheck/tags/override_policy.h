#pragma once

#include "archcheck/tags/arch_tag.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::tags {

struct OverridePolicy {
  // Detail fields every override must carry: reason, expires, ticket, approved_by.
  std::vector<std::string> required_fields{"reason"};
  bool warn_no_expiry{false};
  // Expiry dates further out than this are rejected. 0 disables the check.
  int max_expiry_days{180};
  // Expired overrides are errors when true, warnings (still not honored) otherwise.
  bool fail_on_expired{true};
};

struct OverrideCheck {
  bool valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Checks one override against policy as of `today` ("YYYY-MM-DD").
// Only a valid override may suppress a violation.
[[nodiscard]] OverrideCheck check_override(const OverrideTag& tag, const OverridePolicy& policy,
                                           std::string_view today);

// Days from `from` to `to`; nullopt when either is not a valid YYYY-MM-DD date.
[[nodiscard]] std::optional<int> days_between(std::string_view from, std::string_view to);

}  // namespace archcheck::tags
