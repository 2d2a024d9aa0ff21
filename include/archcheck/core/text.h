#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::core {

// Locale-independent ASCII helpers. No std::tolower / std::isalpha: results must not
// depend on the process locale.

inline bool is_ascii_upper(const char ch) {
  return ch >= 'A' && ch <= 'Z';
}

inline bool is_ascii_lower(const char ch) {
  return ch >= 'a' && ch <= 'z';
}

inline bool is_ascii_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

inline bool is_ascii_alnum(const char ch) {
  return is_ascii_upper(ch) || is_ascii_lower(ch) || is_ascii_digit(ch);
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// A-Z -> a-z; everything else unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    constexpr char kCaseOffset = 'a' - 'A';
    result.push_back(is_ascii_upper(ch) ? static_cast<char>(ch + kCaseOffset) : ch);
  }
  return result;
}

inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    constexpr char kCaseOffset = 'a' - 'A';
    result.push_back(is_ascii_lower(ch) ? static_cast<char>(ch - kCaseOffset) : ch);
  }
  return result;
}

// Strips leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

inline bool contains(const std::string_view haystack, const std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

inline bool iequals(const std::string_view a, const std::string_view b) {
  return a.size() == b.size() && normalize_ascii_lower(a) == normalize_ascii_lower(b);
}

inline bool icontains(const std::string_view haystack, const std::string_view needle) {
  return contains(normalize_ascii_lower(haystack), normalize_ascii_lower(needle));
}

// Splits on '\n'. A trailing "\r" is kept on each line; callers that care trim it.
std::vector<std::string> split_lines(std::string_view content);

// Splits on a single character; empty pieces are kept.
std::vector<std::string> split(std::string_view input, char delimiter);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

// Breaks an identifier into lowercase words on case changes, '-', '_', '.' and spaces.
// "PaymentService" -> {"payment", "service"}; "HTTPServer" -> {"http", "server"}.
std::vector<std::string> split_identifier_words(std::string_view identifier);

std::string to_kebab_case(std::string_view identifier);
std::string to_snake_case(std::string_view identifier);
std::string to_camel_case(std::string_view identifier);
std::string to_pascal_case(std::string_view identifier);
std::string to_upper_snake_case(std::string_view identifier);

// 1-based line number of a byte offset into content.
int line_at_offset(std::string_view content, std::size_t offset);

// 1-based column of a byte offset into content.
int column_at_offset(std::string_view content, std::size_t offset);

// Levenshtein similarity in [0, 1]: 1 - distance / max(len).
double string_similarity(std::string_view a, std::string_view b);

// Path helpers on '/'-separated strings (no filesystem access).
std::string path_basename(std::string_view path);
std::string path_dirname(std::string_view path);
// Extension including the dot, or "" ("a/b.test.ts" -> ".ts").
std::string path_extension(std::string_view path);
// Basename without its last extension ("a/b.test.ts" -> "b.test").
std::string path_stem(std::string_view path);
// Collapses "./", "x/../" and duplicate separators; converts '\\' to '/'.
std::string normalize_path(std::string_view path);

}  // namespace archcheck::core
