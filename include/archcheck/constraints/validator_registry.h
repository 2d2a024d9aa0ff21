#pragma once

#include "archcheck/constraints/constraint_validator.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::constraints {

// Rule name -> validator. Built once, then shared read-only by every validation thread.
class ValidatorRegistry {
 public:
  // A later registration for the same rule replaces the earlier one.
  void register_validator(std::unique_ptr<const ConstraintValidator> validator);

  // nullptr for a rule nobody registered.
  [[nodiscard]] const ConstraintValidator* find(std::string_view rule) const;

  [[nodiscard]] bool has(std::string_view rule) const { return find(rule) != nullptr; }

  [[nodiscard]] std::vector<std::string> rules() const;

  [[nodiscard]] std::size_t size() const noexcept { return validators_.size(); }

 private:
  std::map<std::string, std::unique_ptr<const ConstraintValidator>, std::less<>> validators_;
};

// Registry holding every built-in rule.
[[nodiscard]] ValidatorRegistry make_default_validator_registry();

}  // namespace archcheck::constraints
