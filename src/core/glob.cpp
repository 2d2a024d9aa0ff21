#include "archcheck/core/glob.h"

#include "archcheck/core/text.h"

namespace archcheck::core {

namespace {

// Matches a bracket class starting at pattern[pi] == '['. On success sets next_pi past ']'.
bool match_class(std::string_view pattern, std::size_t pi, char ch, std::size_t& next_pi) {
  std::size_t i = pi + 1;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }
  bool matched = false;
  bool first = true;
  while (i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    const char lo = pattern[i];
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      const char hi = pattern[i + 2];
      if (ch >= lo && ch <= hi) {
        matched = true;
      }
      i += 3;
    } else {
      if (ch == lo) {
        matched = true;
      }
      ++i;
    }
  }
  if (i >= pattern.size()) {
    // Unterminated class: treat '[' literally.
    next_pi = pi + 1;
    return ch == '[';
  }
  next_pi = i + 1;
  return matched != negate;
}

bool match_from(std::string_view pattern, std::size_t pi, std::string_view path, std::size_t si) {
  while (pi < pattern.size()) {
    const char pc = pattern[pi];

    if (pc == '*') {
      std::size_t stars = pi;
      while (stars < pattern.size() && pattern[stars] == '*') {
        ++stars;
      }
      const bool globstar = stars - pi >= 2;
      if (globstar) {
        // "**/" may match zero directories.
        if (stars < pattern.size() && pattern[stars] == '/') {
          const std::size_t rest = stars + 1;
          if (match_from(pattern, rest, path, si)) {
            return true;
          }
          for (std::size_t k = si; k < path.size(); ++k) {
            if (path[k] == '/' && match_from(pattern, rest, path, k + 1)) {
              return true;
            }
          }
          return false;
        }
        for (std::size_t k = si; k <= path.size(); ++k) {
          if (match_from(pattern, stars, path, k)) {
            return true;
          }
        }
        return false;
      }
      for (std::size_t k = si; k <= path.size(); ++k) {
        if (match_from(pattern, stars, path, k)) {
          return true;
        }
        if (k < path.size() && path[k] == '/') {
          break;
        }
      }
      return false;
    }

    if (si >= path.size()) {
      return false;
    }

    if (pc == '?') {
      if (path[si] == '/') {
        return false;
      }
      ++pi;
      ++si;
      continue;
    }

    if (pc == '[') {
      std::size_t next_pi = pi;
      if (!match_class(pattern, pi, path[si], next_pi)) {
        return false;
      }
      pi = next_pi;
      ++si;
      continue;
    }

    if (pc == '\\' && pi + 1 < pattern.size()) {
      ++pi;
    }
    if (pattern[pi] != path[si]) {
      return false;
    }
    ++pi;
    ++si;
  }
  return si == path.size();
}

std::string strip_dot_prefix(std::string_view value) {
  while (value.size() >= 2 && value[0] == '.' && value[1] == '/') {
    value.remove_prefix(2);
  }
  return std::string{value};
}

}  // namespace

std::vector<std::string> expand_braces(const std::string_view pattern) {
  // Find the first top-level '{' with a matching '}'.
  std::size_t open = std::string_view::npos;
  std::size_t close = std::string_view::npos;
  int depth = 0;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == '{') {
      if (depth == 0) {
        open = i;
      }
      ++depth;
    } else if (pattern[i] == '}' && depth > 0) {
      --depth;
      if (depth == 0) {
        close = i;
        break;
      }
    }
  }
  if (open == std::string_view::npos || close == std::string_view::npos) {
    return {std::string{pattern}};
  }

  // Split the body on top-level commas.
  std::vector<std::string> options;
  std::string current;
  depth = 0;
  for (std::size_t i = open + 1; i < close; ++i) {
    const char ch = pattern[i];
    if (ch == ',' && depth == 0) {
      options.push_back(current);
      current.clear();
      continue;
    }
    if (ch == '{') {
      ++depth;
    } else if (ch == '}') {
      --depth;
    }
    current.push_back(ch);
  }
  options.push_back(current);

  const std::string_view prefix = pattern.substr(0, open);
  const std::string_view suffix = pattern.substr(close + 1);

  std::vector<std::string> expanded;
  for (const auto& option : options) {
    std::string candidate{prefix};
    candidate += option;
    candidate += suffix;
    for (auto& item : expand_braces(candidate)) {
      expanded.push_back(std::move(item));
    }
  }
  return expanded;
}

bool glob_match(const std::string_view pattern, const std::string_view path) {
  const std::string subject = strip_dot_prefix(normalize_path(path));
  for (const auto& alternative : expand_braces(pattern)) {
    const std::string plain = strip_dot_prefix(alternative);
    const bool base_only = plain.find('/') == std::string::npos;
    const std::string target = base_only ? path_basename(subject) : subject;
    if (match_from(plain, 0, target, 0)) {
      return true;
    }
    // Absolute subjects still match relative "**/..." patterns.
    if (!base_only && !subject.empty() && subject.front() == '/' &&
        match_from(plain, 0, subject.substr(1), 0)) {
      return true;
    }
  }
  return false;
}

}  // namespace archcheck::core
