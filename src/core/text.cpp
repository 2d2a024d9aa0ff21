#include "archcheck/core/text.h"

#include <algorithm>

namespace archcheck::core {

std::vector<std::string> split_lines(const std::string_view content) {
  return split(content, '\n');
}

std::vector<std::string> split(const std::string_view input, const char delimiter) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = input.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(input.substr(start));
      break;
    }
    parts.emplace_back(input.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(parts[i]);
  }
  return out;
}

std::vector<std::string> split_identifier_words(const std::string_view identifier) {
  std::vector<std::string> words;
  std::string current;

  const auto flush = [&]() {
    if (!current.empty()) {
      words.push_back(normalize_ascii_lower(current));
      current.clear();
    }
  };

  for (std::size_t i = 0; i < identifier.size(); ++i) {
    const char ch = identifier[i];
    if (!is_ascii_alnum(ch)) {
      flush();
      continue;
    }
    if (is_ascii_upper(ch) && !current.empty()) {
      const char prev = current.back();
      const bool next_is_lower = i + 1 < identifier.size() && is_ascii_lower(identifier[i + 1]);
      // "fooBar" splits before 'B'; "HTTPServer" splits before 'S'.
      if (is_ascii_lower(prev) || is_ascii_digit(prev) || (is_ascii_upper(prev) && next_is_lower)) {
        flush();
      }
    }
    current.push_back(ch);
  }
  flush();
  return words;
}

std::string to_kebab_case(const std::string_view identifier) {
  return join(split_identifier_words(identifier), "-");
}

std::string to_snake_case(const std::string_view identifier) {
  return join(split_identifier_words(identifier), "_");
}

std::string to_upper_snake_case(const std::string_view identifier) {
  return normalize_ascii_upper(to_snake_case(identifier));
}

std::string to_pascal_case(const std::string_view identifier) {
  std::string out;
  for (auto word : split_identifier_words(identifier)) {
    if (!word.empty() && is_ascii_lower(word[0])) {
      word[0] = static_cast<char>(word[0] - ('a' - 'A'));
    }
    out += word;
  }
  return out;
}

std::string to_camel_case(const std::string_view identifier) {
  std::string out = to_pascal_case(identifier);
  if (!out.empty() && is_ascii_upper(out[0])) {
    out[0] = static_cast<char>(out[0] + ('a' - 'A'));
  }
  return out;
}

int line_at_offset(const std::string_view content, const std::size_t offset) {
  const std::size_t end = std::min(offset, content.size());
  return 1 + static_cast<int>(std::count(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
}

int column_at_offset(const std::string_view content, const std::size_t offset) {
  const std::size_t end = std::min(offset, content.size());
  const std::size_t line_start = end == 0 ? std::string_view::npos : content.rfind('\n', end - 1);
  if (line_start == std::string_view::npos) {
    return static_cast<int>(end) + 1;
  }
  return static_cast<int>(end - line_start);
}

double string_similarity(const std::string_view a, const std::string_view b) {
  if (a.empty() && b.empty()) {
    return 1.0;
  }
  // Two-row Levenshtein.
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> curr(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    prev[j] = j;
  }
  for (std::size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }
  const auto longest = static_cast<double>(std::max(a.size(), b.size()));
  return 1.0 - static_cast<double>(prev[b.size()]) / longest;
}

std::string path_basename(const std::string_view path) {
  const std::size_t pos = path.find_last_of("/\\");
  return std::string{pos == std::string_view::npos ? path : path.substr(pos + 1)};
}

std::string path_dirname(const std::string_view path) {
  const std::size_t pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) {
    return ".";
  }
  if (pos == 0) {
    return "/";
  }
  return std::string{path.substr(0, pos)};
}

std::string path_extension(const std::string_view path) {
  const std::string base = path_basename(path);
  const std::size_t dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return {};
  }
  return base.substr(dot);
}

std::string path_stem(const std::string_view path) {
  const std::string base = path_basename(path);
  const std::string ext = path_extension(base);
  return base.substr(0, base.size() - ext.size());
}

std::string normalize_path(const std::string_view path) {
  std::string unified{path};
  std::replace(unified.begin(), unified.end(), '\\', '/');
  const bool absolute = !unified.empty() && unified.front() == '/';

  std::vector<std::string> kept;
  for (auto& segment : split(unified, '/')) {
    if (segment.empty() || segment == ".") {
      continue;
    }
    if (segment == ".." && !kept.empty() && kept.back() != "..") {
      kept.pop_back();
      continue;
    }
    kept.push_back(std::move(segment));
  }

  std::string out = join(kept, "/");
  return absolute ? "/" + out : out;
}

}  // namespace archcheck::core
