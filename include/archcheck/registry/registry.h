#pragma once

#include "archcheck/registry/constraint.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace archcheck::registry {

struct Hint {
  std::string text;
  std::optional<std::string> example;
};

struct Pointer {
  std::string uri;
  std::string label;
};

// Where a mixin may be applied: in a registry `mixins` list, inline via "+id" on the
// @arch tag, or both.
enum class InlineMode {
  kAllowed,
  kOnly,
  kForbidden,
};

// One architectural role. `inherits` names at most one parent; the relation must be acyclic.
struct ArchitectureNode {
  std::string description;
  std::string rationale;
  std::optional<std::string> inherits;
  std::vector<std::string> mixins;
  std::vector<Constraint> constraints;
  // "rule" or "rule:value" entries removing inherited constraints.
  std::vector<std::string> exclude_constraints;
  std::vector<Hint> hints;
  std::vector<Pointer> pointers;
  std::optional<NamingSpec> naming;
  std::string version;
  std::optional<std::string> deprecated_from;
  std::optional<std::string> migration_guide;
  bool singleton{false};
  std::vector<std::string> expected_intents;
};

// Reusable constraint bundle. Mixins neither inherit nor include other mixins.
struct Mixin {
  std::string description;
  std::string rationale;
  std::vector<Constraint> constraints;
  std::vector<Hint> hints;
  std::vector<Pointer> pointers;
  InlineMode inline_mode{InlineMode::kAllowed};
};

// archId -> node, mixinId -> mixin. std::map keeps every iteration deterministic.
struct Registry {
  std::map<std::string, ArchitectureNode> nodes;
  std::map<std::string, Mixin> mixins;

  [[nodiscard]] const ArchitectureNode* find_node(const std::string& arch_id) const;
  [[nodiscard]] const Mixin* find_mixin(const std::string& mixin_id) const;
};

}  // namespace archcheck::registry
