#include "archcheck/registry/constraint.h"

#include "archcheck/core/text.h"

#include <cstdlib>
#include <sstream>

namespace archcheck::registry {

std::string_view to_string(const Severity severity) noexcept {
  switch (severity) {
    case Severity::kInfo:
      return "info";
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
  }
  return "error";
}

std::optional<Severity> severity_from_string(const std::string_view text) {
  const std::string lowered = core::normalize_ascii_lower(text);
  if (lowered == "info") {
    return Severity::kInfo;
  }
  if (lowered == "warning" || lowered == "warn") {
    return Severity::kWarning;
  }
  if (lowered == "error") {
    return Severity::kError;
  }
  return std::nullopt;
}

std::string format_number(const double number) {
  std::ostringstream oss;
  oss << number;
  return oss.str();
}

std::string value_to_string(const ConstraintValue& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
    return core::join(*list, ",");
  }
  if (const auto* number = std::get_if<double>(&value)) {
    return format_number(*number);
  }
  return {};
}

std::vector<std::string> value_to_list(const ConstraintValue& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return {*text};
  }
  if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
    return *list;
  }
  if (const auto* number = std::get_if<double>(&value)) {
    return {format_number(*number)};
  }
  return {};
}

std::optional<double> value_to_number(const ConstraintValue& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    return *number;
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    const std::string trimmed = core::trim(*text);
    if (trimmed.empty()) {
      return std::nullopt;
    }
    char* end = nullptr;
    const double parsed = std::strtod(trimmed.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      return parsed;
    }
  }
  return std::nullopt;
}

}  // namespace archcheck::registry
