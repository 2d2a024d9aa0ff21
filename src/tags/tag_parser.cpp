#include "archcheck/tags/tag_parser.h"

#include "archcheck/core/text.h"
#include "archcheck/semantic/comment_scanner.h"

#include <algorithm>
#include <regex>

namespace archcheck::tags {

namespace {

const std::regex kArchPattern(R"(@arch\s+([A-Za-z_][\w-]*(?:\.[\w-]+)*)((?:[ \t]+\+[\w-]+)*))");
const std::regex kMixinPattern(R"(\+([\w-]+))");
const std::regex kOverridePattern(R"(@override\s+([\w-]+)(?::(\S+))?)");
const std::regex kReasonPattern(R"(@reason\s+(.+))");
const std::regex kExpiresPattern(R"(@expires\s+(\S+))");
const std::regex kTicketPattern(R"(@ticket\s+(\S+))");
const std::regex kApprovedByPattern(R"(@approved_by\s+(.+))");
const std::regex kIntentPattern(R"(@intent:([\w-]+))");

// Drops a trailing block-comment terminator and surrounding whitespace.
std::string clean_value(const std::string& raw) {
  std::string value = core::trim(raw);
  if (value.size() >= 2 && value.compare(value.size() - 2, 2, "*/") == 0) {
    value = core::trim(value.substr(0, value.size() - 2));
  }
  return value;
}

std::optional<std::string> capture(const std::string& line, const std::regex& pattern) {
  std::smatch match;
  if (std::regex_search(line, match, pattern)) {
    std::string value = clean_value(match[1].str());
    if (!value.empty()) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

bool is_placeholder_intent(const std::string_view name) {
  const std::string lowered = core::normalize_ascii_lower(name);
  return lowered == "name" || lowered == "example" || lowered == "placeholder";
}

ParsedTags parse_tags(const std::string_view content, const std::string_view extension) {
  ParsedTags tags;
  const auto spans = semantic::find_comments(content, extension);
  const std::size_t header_end = semantic::first_code_offset(content, spans);

  for (const auto& span : spans) {
    const std::string_view text = content.substr(span.begin, span.end - span.begin);
    const bool in_header = span.begin < header_end;
    const int first_line = core::line_at_offset(content, span.begin);

    // Overrides attach their detail lines only within the same comment.
    OverrideTag* current_override = nullptr;
    const auto lines = core::split_lines(text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const std::string& line = lines[i];
      const int line_number = first_line + static_cast<int>(i);

      if (!tags.arch.has_value()) {
        std::smatch match;
        if (std::regex_search(line, match, kArchPattern)) {
          ArchTag arch;
          arch.arch_id = match[1].str();
          arch.line = line_number;
          const std::string mixins = match[2].str();
          for (std::sregex_iterator it(mixins.begin(), mixins.end(), kMixinPattern), end;
               it != end; ++it) {
            arch.inline_mixins.push_back((*it)[1].str());
          }
          tags.arch = std::move(arch);
        }
      }

      std::smatch override_match;
      if (std::regex_search(line, override_match, kOverridePattern)) {
        OverrideTag tag;
        tag.rule = override_match[1].str();
        tag.value = override_match[2].matched ? clean_value(override_match[2].str()) : "";
        tag.line = line_number;
        tags.overrides.push_back(std::move(tag));
        current_override = &tags.overrides.back();
        continue;
      }

      if (current_override != nullptr) {
        if (auto reason = capture(line, kReasonPattern)) {
          current_override->reason = std::move(reason);
        } else if (auto expires = capture(line, kExpiresPattern)) {
          current_override->expires = std::move(expires);
        } else if (auto ticket = capture(line, kTicketPattern)) {
          current_override->ticket = std::move(ticket);
        } else if (auto approver = capture(line, kApprovedByPattern)) {
          current_override->approved_by = std::move(approver);
        }
      }

      for (std::sregex_iterator it(line.begin(), line.end(), kIntentPattern), end; it != end;
           ++it) {
        const std::string name = (*it)[1].str();
        if (is_placeholder_intent(name)) {
          continue;
        }
        tags.intents.push_back(IntentAnnotation{name, line_number, in_header});
      }
    }
  }
  return tags;
}

std::vector<std::string> file_level_intent_names(const ParsedTags& tags) {
  std::vector<std::string> names;
  for (const auto& intent : tags.intents) {
    if (intent.file_level &&
        std::find(names.begin(), names.end(), intent.name) == names.end()) {
      names.push_back(intent.name);
    }
  }
  return names;
}

}  // namespace archcheck::tags
