#include "archcheck/constraints/pattern_compiler.h"

#include <array>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace archcheck::constraints {

namespace {

constexpr std::string_view kLiteralFlags = "dgimsuy";

template <typename Compiled>
struct PatternCache {
  std::mutex mutex;
  std::map<std::string, std::shared_ptr<const Compiled>> entries;

  std::shared_ptr<const Compiled> find(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = entries.find(key);
    return it != entries.end() ? it->second : nullptr;
  }

  std::shared_ptr<const Compiled> insert(const std::string& key,
                                         std::shared_ptr<const Compiled> compiled) {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.emplace(key, std::move(compiled)).first->second;
  }
};

PatternCache<std::regex>& regex_cache() {
  static PatternCache<std::regex> cache;
  return cache;
}

PatternCache<re2::RE2>& text_cache() {
  static PatternCache<re2::RE2> cache;
  return cache;
}

bool is_quantifier_start(const char ch) {
  return ch == '+' || ch == '*' || ch == '{';
}

core::Result<std::shared_ptr<const std::regex>, PatternError> compile_cached(
    const std::string& source, const std::regex_constants::syntax_option_type options,
    const std::string& cache_key) {
  using RegexResult = core::Result<std::shared_ptr<const std::regex>, PatternError>;
  if (auto cached = regex_cache().find(cache_key)) {
    return RegexResult::ok(std::move(cached));
  }

  std::shared_ptr<const std::regex> compiled;
  try {
    compiled = std::make_shared<const std::regex>(source, options);
  } catch (const std::regex_error& e) {
    return RegexResult::err(PatternError{"Invalid regex pattern '" + source + "': " + e.what()});
  }
  return RegexResult::ok(regex_cache().insert(cache_key, std::move(compiled)));
}

// `prefix` carries inline flags ("(?m)") so it stays out of error messages.
core::Result<TextPattern, PatternError> compile_text_cached(const std::string& prefix,
                                                            const std::string& source,
                                                            const re2::RE2::Options& options,
                                                            const std::string& cache_key) {
  using TextResult = core::Result<TextPattern, PatternError>;
  if (source.size() > kMaxPatternLength) {
    return TextResult::err(PatternError{"Pattern exceeds maximum length of " +
                                        std::to_string(kMaxPatternLength) + " characters"});
  }
  if (auto cached = text_cache().find(cache_key)) {
    return TextResult::ok(std::move(cached));
  }

  auto compiled = std::make_shared<const re2::RE2>(prefix + source, options);
  if (!compiled->ok()) {
    return TextResult::err(
        PatternError{"Invalid regex pattern '" + source + "': " + compiled->error()});
  }
  return TextResult::ok(text_cache().insert(cache_key, std::move(compiled)));
}

re2::RE2::Options text_options() {
  re2::RE2::Options options;
  options.set_log_errors(false);
  return options;
}

}  // namespace

PatternLiteral parse_pattern_literal(const std::string_view text) {
  if (text.size() >= 2 && text.front() == '/') {
    const auto close = text.rfind('/');
    if (close > 0) {
      const std::string_view flags = text.substr(close + 1);
      const bool flags_ok = flags.find_first_not_of(kLiteralFlags) == std::string_view::npos;
      if (flags_ok) {
        return PatternLiteral{std::string(text.substr(1, close - 1)), std::string(flags)};
      }
    }
  }
  return PatternLiteral{std::string(text), ""};
}

std::optional<std::string> check_pattern_safety(const std::string_view source) {
  if (source.size() > kMaxPatternLength) {
    return "Pattern exceeds maximum length of " + std::to_string(kMaxPatternLength) +
           " characters";
  }

  // One entry per open group: whether its body contains a quantifier.
  std::vector<bool> groups;
  bool in_class = false;
  for (std::size_t i = 0; i < source.size(); ++i) {
    const char ch = source[i];
    if (ch == '\\') {
      ++i;
      continue;
    }
    if (in_class) {
      in_class = ch != ']';
      continue;
    }
    switch (ch) {
      case '[':
        in_class = true;
        break;
      case '(':
        groups.push_back(false);
        break;
      case ')': {
        if (groups.empty()) {
          break;
        }
        const bool body_quantified = groups.back();
        groups.pop_back();
        if (body_quantified && i + 1 < source.size() && is_quantifier_start(source[i + 1])) {
          return std::string(
              "Pattern contains nested quantifiers that may cause catastrophic backtracking");
        }
        if (body_quantified && !groups.empty()) {
          groups.back() = true;
        }
        break;
      }
      case '+':
      case '*':
      case '{':
        if (!groups.empty()) {
          groups.back() = true;
        }
        break;
      default:
        break;
    }
  }
  return std::nullopt;
}

core::Result<TextPattern, PatternError> compile_content_pattern(const std::string_view pattern) {
  const PatternLiteral literal = parse_pattern_literal(pattern);

  // Content patterns always match per line and let '.' cross newlines.
  auto options = text_options();
  options.set_dot_nl(true);
  const bool icase = literal.flags.find('i') != std::string::npos;
  options.set_case_sensitive(!icase);
  return compile_text_cached("(?m)", literal.source, options,
                             std::string(icase ? "c:i:" : "c::") + literal.source);
}

core::Result<TextPattern, PatternError> compile_text_pattern(const std::string_view pattern) {
  const std::string source(pattern);
  return compile_text_cached("", source, text_options(), "t::" + source);
}

core::Result<std::shared_ptr<const std::regex>, PatternError> compile_plain_pattern(
    const std::string_view pattern) {
  const std::string source(pattern);
  if (auto unsafe = check_pattern_safety(source); unsafe.has_value()) {
    return core::Result<std::shared_ptr<const std::regex>, PatternError>::err(
        PatternError{std::move(*unsafe)});
  }
  return compile_cached(source, std::regex_constants::ECMAScript, "p::" + source);
}

std::string escape_regex(const std::string_view literal) {
  constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(literal.size() * 2);
  for (const char ch : literal) {
    if (kSpecial.find(ch) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

core::Result<std::string, PatternError> compile_naming_pattern(const registry::NamingSpec& spec) {
  if (!spec.case_style && !spec.prefix && !spec.suffix && !spec.extension) {
    return core::Result<std::string, PatternError>::err(PatternError{
        "Naming pattern must specify at least one of: case, prefix, suffix, extension"});
  }

  static const std::map<std::string, std::string, std::less<>> kCasePatterns = {
      {"PascalCase", "[A-Z][a-zA-Z0-9]*"},
      {"camelCase", "[a-z][a-zA-Z0-9]*"},
      {"snake_case", "[a-z][a-z0-9]*(?:_[a-z0-9]+)*"},
      {"UPPER_CASE", "[A-Z][A-Z0-9]*(?:_[A-Z0-9]+)*"},
      {"kebab-case", "[a-z][a-z0-9]*(?:-[a-z0-9]+)*"},
  };

  const std::string case_style = spec.case_style.value_or("PascalCase");
  const auto it = kCasePatterns.find(case_style);
  if (it == kCasePatterns.end()) {
    return core::Result<std::string, PatternError>::err(PatternError{
        "Unknown naming case '" + case_style +
        "' (expected PascalCase, camelCase, snake_case, UPPER_CASE or kebab-case)"});
  }

  std::string pattern = "^";
  if (spec.prefix) {
    pattern += escape_regex(*spec.prefix);
  }
  pattern += it->second;
  if (spec.suffix) {
    pattern += escape_regex(*spec.suffix);
  }
  if (spec.extension) {
    pattern += escape_regex(*spec.extension);
  }
  pattern += "$";
  return core::Result<std::string, PatternError>::ok(std::move(pattern));
}

core::Result<std::shared_ptr<const std::regex>, PatternError> compile_naming_regex(
    const registry::NamingSpec& spec) {
  auto source = compile_naming_pattern(spec);
  if (!source.has_value()) {
    return core::Result<std::shared_ptr<const std::regex>, PatternError>::err(source.error());
  }
  return compile_cached(source.value(), std::regex_constants::ECMAScript, "n::" + source.value());
}

std::string describe_naming_pattern(const registry::NamingSpec& spec) {
  std::vector<std::string> parts;
  if (spec.prefix) {
    parts.push_back("prefix \"" + *spec.prefix + "\"");
  }
  if (spec.case_style) {
    parts.push_back(*spec.case_style);
  }
  if (spec.suffix) {
    parts.push_back("suffix \"" + *spec.suffix + "\"");
  }
  if (spec.extension) {
    parts.push_back("extension \"" + *spec.extension + "\"");
  }
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += parts[i];
  }
  return out;
}

bool search(const re2::RE2& pattern, const std::string_view content) {
  return re2::RE2::PartialMatch(re2::StringPiece(content.data(), content.size()), pattern);
}

std::vector<PatternMatch> find_matches(const re2::RE2& pattern, const std::string_view content,
                                       const std::size_t limit) {
  const re2::StringPiece text(content.data(), content.size());
  const int groups = pattern.NumberOfCapturingGroups() > 0 ? 2 : 1;
  std::array<re2::StringPiece, 2> submatch;

  std::vector<PatternMatch> matches;
  std::size_t pos = 0;
  while (pos <= content.size() &&
         pattern.Match(text, pos, content.size(), re2::RE2::UNANCHORED, submatch.data(), groups)) {
    const auto& whole = submatch[0];
    PatternMatch match;
    match.offset = static_cast<std::size_t>(whole.data() - content.data());
    match.length = whole.size();
    match.text = std::string(whole.data(), whole.size());
    match.capture = groups == 2 && submatch[1].data() != nullptr
                        ? std::string(submatch[1].data(), submatch[1].size())
                        : match.text;
    pos = match.offset + (match.length == 0 ? 1 : match.length);
    matches.push_back(std::move(match));
    if (limit != 0 && matches.size() >= limit) {
      break;
    }
  }
  return matches;
}

}  // namespace archcheck::constraints
