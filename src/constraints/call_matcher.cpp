#include "archcheck/constraints/call_matcher.h"

#include "archcheck/constraints/pattern_compiler.h"

#include <regex>
#include <string>

namespace archcheck::constraints {

namespace {

bool is_regex_literal(const std::string_view pattern) {
  return pattern.size() >= 2 && pattern.front() == '/' && pattern.rfind('/') > 0;
}

std::string glob_to_regex(const std::string_view pattern) {
  std::string out = "^";
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == '*') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        out += ".*";
        ++i;
      } else {
        out += "[^.]*";
      }
      continue;
    }
    out += escape_regex(pattern.substr(i, 1));
  }
  out += "$";
  return out;
}

}  // namespace

bool callee_matches(const std::string_view pattern, const std::string_view callee) {
  if (pattern == "*" || pattern == callee) {
    return true;
  }
  if (is_regex_literal(pattern)) {
    const PatternLiteral literal = parse_pattern_literal(pattern);
    auto compiled = compile_plain_pattern(literal.source);
    if (!compiled.has_value()) {
      return false;
    }
    return std::regex_search(callee.begin(), callee.end(), *compiled.value());
  }
  if (pattern.find('*') == std::string_view::npos) {
    return false;
  }
  if (pattern.size() > 3 && pattern.substr(pattern.size() - 3) == ".**") {
    const std::string_view base = pattern.substr(0, pattern.size() - 3);
    return callee.size() > base.size() + 1 && callee.substr(0, base.size()) == base &&
           callee[base.size()] == '.';
  }
  if (pattern.size() > 2 && pattern.substr(pattern.size() - 2) == ".*") {
    const std::string_view base = pattern.substr(0, pattern.size() - 2);
    if (callee.size() <= base.size() + 1 || callee.substr(0, base.size()) != base ||
        callee[base.size()] != '.') {
      return false;
    }
    return callee.substr(base.size() + 1).find('.') == std::string_view::npos;
  }
  auto compiled = compile_plain_pattern(glob_to_regex(pattern));
  if (!compiled.has_value()) {
    return false;
  }
  return std::regex_match(callee.begin(), callee.end(), *compiled.value());
}

bool call_matches(const std::string_view pattern, const semantic::FunctionCallInfo& call) {
  return callee_matches(pattern, call.callee);
}

}  // namespace archcheck::constraints
