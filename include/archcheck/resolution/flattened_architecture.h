#pragma once

#include "archcheck/registry/constraint.h"
#include "archcheck/registry/registry.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::resolution {

// Side-channel record of a constraint displaced, cancelled or contradicted during resolution.
struct ConflictReport {
  std::string rule;
  std::string value;
  std::string winner;  // source that holds the slot afterwards ("" when nothing does)
  std::string loser;   // source whose entry was displaced
  std::string resolution;
  registry::Severity severity{registry::Severity::kInfo};
  // The displaced entry, intact. Empty for purely advisory reports.
  std::optional<registry::Constraint> dropped;
};

// Fully resolved view of one architecture. Immutable once returned.
struct FlattenedArchitecture {
  std::string arch_id;
  std::vector<std::string> inheritance_chain;  // root -> leaf
  std::vector<std::string> applied_mixins;     // application order
  std::vector<registry::Constraint> constraints;
  std::vector<registry::Hint> hints;
  std::vector<registry::Pointer> pointers;

  // Leaf-most non-empty value along the chain.
  std::string description;
  std::string rationale;
  std::string version;
  std::optional<std::string> deprecated_from;
  std::optional<std::string> migration_guide;
  std::optional<registry::NamingSpec> naming;
  bool singleton{false};
  std::vector<std::string> expected_intents;
};

struct ResolutionResult {
  FlattenedArchitecture architecture;
  std::vector<ConflictReport> conflicts;
};

enum class ResolutionErrorKind {
  kArchitectureNotFound,
  kCircularInheritance,
  kMixinNotFound,
};

struct ResolutionError {
  ResolutionErrorKind kind{ResolutionErrorKind::kArchitectureNotFound};
  std::string message;
  std::string arch_id;             // the architecture being resolved
  std::vector<std::string> chain;  // walk so far, leaf first
};

[[nodiscard]] std::string_view to_string(ResolutionErrorKind kind) noexcept;

}  // namespace archcheck::resolution
