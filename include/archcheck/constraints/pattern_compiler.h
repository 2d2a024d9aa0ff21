#pragma once

#include "archcheck/core/result.h"
#include "archcheck/registry/constraint.h"

#include <re2/re2.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::constraints {

// Longest pattern accepted from a registry.
inline constexpr std::size_t kMaxPatternLength = 5000;

struct PatternError {
  std::string message;
};

// A pattern as written in a registry: either a bare source ("^export class") or an explicit
// literal with flags ("/todo/i"). Bare sources get the implicit flags "ms".
struct PatternLiteral {
  std::string source;
  std::string flags;
};

[[nodiscard]] PatternLiteral parse_pattern_literal(std::string_view text);

// Rejects patterns that are too long or carry a quantified group whose body is itself
// quantified ("(a+)+"), the usual catastrophic-backtracking shape for std::regex.
[[nodiscard]] std::optional<std::string> check_pattern_safety(std::string_view source);

// Patterns run against whole file contents. RE2 matches in linear time with bounded memory,
// so file size never turns into recursion depth.
using TextPattern = std::shared_ptr<const re2::RE2>;

// Compiles a content pattern. Flags: m (line anchors per line), s (dot matches newline),
// i (case-insensitive); others are accepted and ignored. m and s are always on.
// Compiled patterns are cached process-wide and shared between threads.
[[nodiscard]] core::Result<TextPattern, PatternError> compile_content_pattern(
    std::string_view pattern);

// Compiles a pattern searched in file text with no implicit flags ('.' stops at '\n').
[[nodiscard]] core::Result<TextPattern, PatternError> compile_text_pattern(
    std::string_view pattern);

// Compiles a single-line pattern (file names, callees, import specifiers) with no implicit
// flags.
[[nodiscard]] core::Result<std::shared_ptr<const std::regex>, PatternError> compile_plain_pattern(
    std::string_view pattern);

[[nodiscard]] std::string escape_regex(std::string_view literal);

// Anchored regex source for a structured naming spec:
// "^" + prefix + case pattern + suffix + extension + "$", literals escaped.
// A spec with no field set is an error.
[[nodiscard]] core::Result<std::string, PatternError> compile_naming_pattern(
    const registry::NamingSpec& spec);

// compile_naming_pattern, compiled. The built-in case patterns are exempt from the
// nested-quantifier check.
[[nodiscard]] core::Result<std::shared_ptr<const std::regex>, PatternError> compile_naming_regex(
    const registry::NamingSpec& spec);

// prefix "I", PascalCase, suffix "Repository", extension ".ts"
[[nodiscard]] std::string describe_naming_pattern(const registry::NamingSpec& spec);

struct PatternMatch {
  std::size_t offset{0};
  std::size_t length{0};
  std::string text;
  // Capture group 1 when the pattern has one and it took part; otherwise the whole match.
  std::string capture;
};

[[nodiscard]] bool search(const re2::RE2& pattern, std::string_view content);

// Non-overlapping matches in order, at most `limit` (0 = unlimited).
[[nodiscard]] std::vector<PatternMatch> find_matches(const re2::RE2& pattern,
                                                     std::string_view content,
                                                     std::size_t limit = 0);

}  // namespace archcheck::constraints
