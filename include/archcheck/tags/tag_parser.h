#pragma once

#include "archcheck/tags/arch_tag.h"

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::tags {

// Scans comments for @arch, @override and @intent annotations. Tags outside comments
// (e.g. in string literals) are ignored. The first @arch tag wins.
[[nodiscard]] ParsedTags parse_tags(std::string_view content, std::string_view extension);

// Intent names from annotations in the file header only.
[[nodiscard]] std::vector<std::string> file_level_intent_names(const ParsedTags& tags);

// Template placeholders ("name", "example", "placeholder") copied from docs.
[[nodiscard]] bool is_placeholder_intent(std::string_view name);

}  // namespace archcheck::tags
