#pragma once

#include <optional>
#include <string>
#include <vector>

namespace archcheck::tags {

// "@arch svc.payment +audited +cached"
struct ArchTag {
  std::string arch_id;
  std::vector<std::string> inline_mixins;
  int line{0};
};

// "@override forbid_import:axios" plus the @reason / @expires / @ticket / @approved_by
// lines that follow it in the same comment.
struct OverrideTag {
  std::string rule;
  std::string value;  // "" when the tag names no value
  std::optional<std::string> reason;
  std::optional<std::string> expires;  // YYYY-MM-DD
  std::optional<std::string> ticket;
  std::optional<std::string> approved_by;
  int line{0};
};

// "@intent:name"
struct IntentAnnotation {
  std::string name;
  int line{0};
  // True when the annotation sits in the comment header before any code.
  bool file_level{false};
};

struct ParsedTags {
  std::optional<ArchTag> arch;
  std::vector<OverrideTag> overrides;
  std::vector<IntentAnnotation> intents;
};

}  // namespace archcheck::tags
