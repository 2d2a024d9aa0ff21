#include "archcheck/semantic/comment_scanner.h"

#include "archcheck/core/text.h"

#include <algorithm>
#include <array>

namespace archcheck::semantic {

namespace {

bool uses_hash_comments(const std::string_view extension) {
  constexpr std::array<std::string_view, 8> kHashLanguages = {
      ".py", ".rb", ".sh", ".bash", ".yaml", ".yml", ".toml", ".pl"};
  const std::string lowered = core::normalize_ascii_lower(extension);
  return std::find(kHashLanguages.begin(), kHashLanguages.end(), lowered) != kHashLanguages.end();
}

// Returns the offset just past the string literal opened at content[start].
std::size_t skip_string(const std::string_view content, const std::size_t start) {
  const char quote = content[start];
  std::size_t i = start + 1;
  while (i < content.size()) {
    const char ch = content[i];
    if (ch == '\\') {
      i += 2;
      continue;
    }
    if (ch == quote) {
      return i + 1;
    }
    // Only template literals span lines.
    if (ch == '\n' && quote != '`') {
      return i;
    }
    ++i;
  }
  return content.size();
}

}  // namespace

std::vector<CommentSpan> find_comments(const std::string_view content,
                                       const std::string_view extension) {
  const bool hash = uses_hash_comments(extension);
  std::vector<CommentSpan> spans;

  std::size_t i = 0;
  while (i < content.size()) {
    const char ch = content[i];

    if (ch == '"' || ch == '\'' || (ch == '`' && !hash)) {
      i = skip_string(content, i);
      continue;
    }

    const bool line_comment =
        hash ? ch == '#' : (ch == '/' && i + 1 < content.size() && content[i + 1] == '/');
    if (line_comment) {
      const std::size_t end = content.find('\n', i);
      const std::size_t stop = end == std::string_view::npos ? content.size() : end;
      spans.push_back(CommentSpan{i, stop});
      i = stop;
      continue;
    }

    if (!hash && ch == '/' && i + 1 < content.size() && content[i + 1] == '*') {
      const std::size_t close = content.find("*/", i + 2);
      const std::size_t stop = close == std::string_view::npos ? content.size() : close + 2;
      spans.push_back(CommentSpan{i, stop});
      i = stop;
      continue;
    }

    ++i;
  }
  return spans;
}

std::string blank_comments(const std::string_view content, const std::vector<CommentSpan>& spans) {
  std::string out{content};
  for (const auto& span : spans) {
    for (std::size_t i = span.begin; i < span.end && i < out.size(); ++i) {
      if (out[i] != '\n') {
        out[i] = ' ';
      }
    }
  }
  return out;
}

std::size_t first_code_offset(const std::string_view content,
                              const std::vector<CommentSpan>& spans) {
  std::size_t i = 0;
  std::size_t next_span = 0;
  while (i < content.size()) {
    if (next_span < spans.size() && i >= spans[next_span].begin) {
      i = std::max(i, spans[next_span].end);
      ++next_span;
      continue;
    }
    if (!core::is_ascii_space(content[i])) {
      return i;
    }
    ++i;
  }
  return content.size();
}

}  // namespace archcheck::semantic
