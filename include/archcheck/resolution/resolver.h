#pragma once

#include "archcheck/core/result.h"
#include "archcheck/registry/registry.h"
#include "archcheck/resolution/flattened_architecture.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::resolution {

// Longest inheritance chain (in nodes) accepted before the walk is treated as circular.
inline constexpr std::size_t kMaxInheritanceDepth = 10;

struct ResolveOptions {
  // Use-site mixins ("+id" on the @arch tag), appended to the leaf's mixin list for this
  // call only.
  std::vector<std::string> inline_mixins;
};

// Flattens archId's inheritance chain and mixins into one ordered constraint list.
//
// Order: root -> leaf; at each node its mixins' constraints, then its own, then its
// exclude_constraints. A slot redeclared closer to the leaf replaces the earlier entry in
// place and the displaced entry is reported in `conflicts`. when/unless/applies_when are
// copied through unevaluated.
//
// Pure and idempotent for a fixed Registry.
[[nodiscard]] core::Result<ResolutionResult, ResolutionError> resolve_architecture(
    const registry::Registry& registry, const std::string& arch_id,
    const ResolveOptions& options = {});

// Rules holding a single limit or pattern per architecture; their slot is the rule alone.
[[nodiscard]] bool is_single_slot_rule(std::string_view rule) noexcept;

// "rule" for single-slot rules, otherwise "rule:<pattern or value>".
[[nodiscard]] std::string slot_key(const registry::Constraint& constraint);

}  // namespace archcheck::resolution
