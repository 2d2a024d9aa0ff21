#include "archcheck/resolution/resolver.h"

#include "archcheck/core/text.h"

#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <utility>

namespace archcheck::resolution {

using registry::Constraint;
using registry::Severity;

namespace {

using ResolveResult = core::Result<ResolutionResult, ResolutionError>;

constexpr std::string_view kMixinSourcePrefix = "mixin:";

ResolveResult fail(ResolutionErrorKind kind, std::string message, const std::string& arch_id,
                   std::vector<std::string> chain) {
  return ResolveResult::err(ResolutionError{kind, std::move(message), arch_id, std::move(chain)});
}

bool value_matches(const Constraint& constraint, const std::string& value) {
  if (constraint.pattern.has_value() && *constraint.pattern == value) {
    return true;
  }
  const auto items = registry::value_to_list(constraint.value);
  return std::find(items.begin(), items.end(), value) != items.end() ||
         registry::value_to_string(constraint.value) == value;
}

std::string strip_at(const std::string& decorator) {
  return !decorator.empty() && decorator.front() == '@' ? decorator.substr(1) : decorator;
}

// Holds accumulated constraints in first-declaration order with one live entry per slot.
// Every removal leaves a ConflictReport behind.
class ConstraintAccumulator {
 public:
  explicit ConstraintAccumulator(std::vector<ConflictReport>& conflicts) : conflicts_(conflicts) {}

  void begin_node(const std::size_t node_index) { node_index_ = node_index; }

  void add(Constraint constraint, bool from_mixin);
  void exclude(const std::string& entry, const std::string& excluder);
  void check_cross_rule_conflicts();

  [[nodiscard]] std::vector<Constraint> take();

 private:
  struct Entry {
    Constraint constraint;
    std::size_t node_index{0};
    bool from_mixin{false};
    bool live{true};
  };

  void drop(std::size_t index, const std::string& winner, std::string resolution,
            Severity severity);
  void apply_allowance(const Constraint& allowance);
  void rekey(std::size_t index, const std::string& old_key);

  std::vector<Entry> entries_;
  std::map<std::string, std::size_t> slots_;
  std::vector<ConflictReport>& conflicts_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
  std::size_t node_index_{0};
};

void ConstraintAccumulator::drop(const std::size_t index, const std::string& winner,
                                 std::string resolution, const Severity severity) {
  Entry& entry = entries_[index];
  entry.live = false;
  const std::string key = slot_key(entry.constraint);
  const auto slot = slots_.find(key);
  if (slot != slots_.end() && slot->second == index) {
    slots_.erase(slot);
  }
  conflicts_.push_back(ConflictReport{entry.constraint.rule,
                                      registry::value_to_string(entry.constraint.value), winner,
                                      entry.constraint.source, std::move(resolution), severity,
                                      entry.constraint});
}

void ConstraintAccumulator::rekey(const std::size_t index, const std::string& old_key) {
  const auto slot = slots_.find(old_key);
  if (slot != slots_.end() && slot->second == index) {
    slots_.erase(slot);
  }
  const std::string new_key = slot_key(entries_[index].constraint);
  if (slots_.find(new_key) == slots_.end()) {
    slots_[new_key] = index;
  }
}

void ConstraintAccumulator::apply_allowance(const Constraint& allowance) {
  const bool imports = allowance.rule == "allow_import";
  const std::string target_rule = imports ? "forbid_import" : "forbid_pattern";

  std::vector<std::string> allowed = registry::value_to_list(allowance.value);
  if (allowance.pattern.has_value()) {
    allowed.push_back(*allowance.pattern);
  }

  for (std::size_t i = 0; i < entries_.size(); ++i) {
    Entry& entry = entries_[i];
    if (!entry.live || entry.constraint.rule != target_rule) {
      continue;
    }

    if (!imports) {
      const bool cancelled = std::any_of(allowed.begin(), allowed.end(), [&](const auto& item) {
        return value_matches(entry.constraint, item);
      });
      if (cancelled) {
        drop(i, allowance.source,
             "'" + allowance.source + "' allows a pattern forbidden by '" +
                 entry.constraint.source + "'",
             Severity::kInfo);
      }
      continue;
    }

    std::vector<std::string> remaining;
    std::vector<std::string> removed;
    for (const auto& module : registry::value_to_list(entry.constraint.value)) {
      if (std::find(allowed.begin(), allowed.end(), module) != allowed.end()) {
        removed.push_back(module);
      } else {
        remaining.push_back(module);
      }
    }
    if (removed.empty()) {
      continue;
    }
    if (remaining.empty()) {
      drop(i, allowance.source,
           "'" + allowance.source + "' allows " + core::join(removed, ", ") + " forbidden by '" +
               entry.constraint.source + "'",
           Severity::kInfo);
      continue;
    }

    const std::string old_key = slot_key(entry.constraint);
    conflicts_.push_back(ConflictReport{
        target_rule, core::join(removed, ","), allowance.source, entry.constraint.source,
        "'" + allowance.source + "' allows " + core::join(removed, ", ") + " forbidden by '" +
            entry.constraint.source + "'",
        Severity::kInfo, entry.constraint});
    entry.constraint.value = remaining;
    rekey(i, old_key);
  }
}

void ConstraintAccumulator::add(Constraint constraint, const bool from_mixin) {
  if (constraint.rule == "allow_import" || constraint.rule == "allow_pattern") {
    apply_allowance(constraint);
  }

  if (constraint.override_inherited) {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
      const Entry& entry = entries_[i];
      if (entry.live && entry.constraint.rule == constraint.rule &&
          entry.constraint.source != constraint.source) {
        drop(i, constraint.source,
             "'" + constraint.source + "' overrides every inherited " + constraint.rule,
             Severity::kInfo);
      }
    }
  }

  const std::string key = slot_key(constraint);
  const auto slot = slots_.find(key);
  if (slot != slots_.end() && entries_[slot->second].live) {
    Entry& previous = entries_[slot->second];
    const Constraint& old = previous.constraint;

    if (old.source != constraint.source) {
      const bool siblings = previous.from_mixin && from_mixin && previous.node_index == node_index_;
      Severity severity = siblings ? Severity::kWarning : Severity::kInfo;
      std::string resolution =
          siblings ? "sibling mixins disagree; later declaration '" + constraint.source + "' wins"
                   : "'" + constraint.source + "' overrides '" + old.source + "'";

      const std::string old_value = registry::value_to_string(old.value);
      const std::string new_value = registry::value_to_string(constraint.value);
      if (old_value != new_value) {
        resolution += " (value " + old_value + " -> " + new_value + ")";
      }
      if (old.severity != constraint.severity) {
        resolution += " (severity " + std::string(registry::to_string(old.severity)) + " -> " +
                      std::string(registry::to_string(constraint.severity)) + ")";
        severity = Severity::kWarning;
      }

      conflicts_.push_back(ConflictReport{old.rule, old_value, constraint.source, old.source,
                                          std::move(resolution), severity, old});
    }

    previous.constraint = std::move(constraint);
    previous.node_index = node_index_;
    previous.from_mixin = from_mixin;
    return;
  }

  entries_.push_back(Entry{std::move(constraint), node_index_, from_mixin, true});
  slots_[key] = entries_.size() - 1;
}

void ConstraintAccumulator::exclude(const std::string& entry, const std::string& excluder) {
  const std::size_t colon = entry.find(':');
  const std::string rule = entry.substr(0, colon);
  const std::string value = colon == std::string::npos ? std::string{} : entry.substr(colon + 1);

  bool matched = false;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const Entry& candidate = entries_[i];
    if (!candidate.live || candidate.constraint.rule != rule ||
        candidate.constraint.source == excluder) {
      continue;
    }
    if (!value.empty() && !value_matches(candidate.constraint, value)) {
      continue;
    }
    drop(i, "", "excluded by '" + excluder + "'", Severity::kInfo);
    matched = true;
  }

  if (!matched) {
    conflicts_.push_back(ConflictReport{
        rule, value, excluder, "",
        "exclude_constraints entry '" + entry + "' on '" + excluder +
            "' matched no inherited constraint",
        Severity::kWarning, std::nullopt});
  }
}

void ConstraintAccumulator::check_cross_rule_conflicts() {
  for (std::size_t r = 0; r < entries_.size(); ++r) {
    if (!entries_[r].live) {
      continue;
    }
    const std::string rule = entries_[r].constraint.rule;

    if (rule == "require_decorator") {
      for (const auto& forbid : entries_) {
        if (!forbid.live || forbid.constraint.rule != "forbid_decorator") {
          continue;
        }
        const auto forbidden = registry::value_to_list(forbid.constraint.value);
        const auto required = registry::value_to_list(entries_[r].constraint.value);
        const bool overlap = std::any_of(required.begin(), required.end(), [&](const auto& req) {
          return std::any_of(forbidden.begin(), forbidden.end(),
                             [&](const auto& fb) { return strip_at(fb) == strip_at(req); });
        });
        if (overlap) {
          const std::string winner = forbid.constraint.source;
          drop(r, winner,
               "forbid_decorator from '" + winner + "' wins over require_decorator from '" +
                   entries_[r].constraint.source + "'",
               Severity::kError);
          break;
        }
      }
      continue;
    }

    if (rule == "require_import") {
      const auto required = registry::value_to_list(entries_[r].constraint.value);
      for (const auto& forbid : entries_) {
        if (!forbid.live || forbid.constraint.rule != "forbid_import") {
          continue;
        }
        for (const auto& module : registry::value_to_list(forbid.constraint.value)) {
          if (std::find(required.begin(), required.end(), module) == required.end()) {
            continue;
          }
          conflicts_.push_back(ConflictReport{
              "require_import", module, "", entries_[r].constraint.source,
              "require_import from '" + entries_[r].constraint.source +
                  "' contradicts forbid_import from '" + forbid.constraint.source +
                  "'; both kept",
              Severity::kError, std::nullopt});
        }
      }
    }
  }
}

std::vector<Constraint> ConstraintAccumulator::take() {
  std::vector<Constraint> out;
  out.reserve(entries_.size());
  for (auto& entry : entries_) {
    if (!entry.live || entry.constraint.rule == "allow_import" ||
        entry.constraint.rule == "allow_pattern") {
      continue;
    }
    out.push_back(std::move(entry.constraint));
  }
  entries_.clear();
  slots_.clear();
  return out;
}

void append_hints(const std::vector<registry::Hint>& hints, std::set<std::string>& seen,
                  std::vector<registry::Hint>& out) {
  for (const auto& hint : hints) {
    if (seen.insert(hint.text).second) {
      out.push_back(hint);
    }
  }
}

void append_pointers(const std::vector<registry::Pointer>& pointers, std::set<std::string>& seen,
                     std::vector<registry::Pointer>& out) {
  for (const auto& pointer : pointers) {
    if (seen.insert(pointer.uri).second) {
      out.push_back(pointer);
    }
  }
}

}  // namespace

std::string_view to_string(const ResolutionErrorKind kind) noexcept {
  switch (kind) {
    case ResolutionErrorKind::kArchitectureNotFound:
      return "architecture_not_found";
    case ResolutionErrorKind::kCircularInheritance:
      return "circular_inheritance";
    case ResolutionErrorKind::kMixinNotFound:
      return "mixin_not_found";
  }
  return "architecture_not_found";
}

bool is_single_slot_rule(const std::string_view rule) noexcept {
  constexpr std::array<std::string_view, 5> kSingleSlot = {
      "max_file_lines", "max_public_methods", "max_similarity", "naming_pattern",
      "location_pattern"};
  return std::find(kSingleSlot.begin(), kSingleSlot.end(), rule) != kSingleSlot.end();
}

std::string slot_key(const Constraint& constraint) {
  if (is_single_slot_rule(constraint.rule)) {
    return constraint.rule;
  }
  const std::string target = constraint.pattern.has_value()
                                 ? *constraint.pattern
                                 : registry::value_to_string(constraint.value);
  return constraint.rule + ":" + target;
}

core::Result<ResolutionResult, ResolutionError> resolve_architecture(
    const registry::Registry& registry, const std::string& arch_id,
    const ResolveOptions& options) {
  // Walk parent links leaf -> root with a visited set.
  std::vector<std::string> chain;
  std::set<std::string> visited;
  if (registry.find_node(arch_id) == nullptr) {
    return fail(ResolutionErrorKind::kArchitectureNotFound,
                "Architecture '" + arch_id + "' not found in registry", arch_id, {});
  }

  std::string current = arch_id;
  while (true) {
    if (!visited.insert(current).second) {
      std::vector<std::string> cycle = chain;
      cycle.push_back(current);
      return fail(ResolutionErrorKind::kCircularInheritance,
                  "Circular inheritance detected: " + core::join(cycle, " -> "), arch_id, cycle);
    }
    chain.push_back(current);
    if (chain.size() > kMaxInheritanceDepth) {
      return fail(ResolutionErrorKind::kCircularInheritance,
                  "Inheritance chain for '" + arch_id + "' exceeds maximum depth of " +
                      std::to_string(kMaxInheritanceDepth),
                  arch_id, chain);
    }

    const registry::ArchitectureNode* node = registry.find_node(current);
    if (!node->inherits.has_value()) {
      break;
    }
    const std::string& parent = *node->inherits;
    if (registry.find_node(parent) == nullptr) {
      return fail(ResolutionErrorKind::kArchitectureNotFound,
                  "Architecture '" + parent + "' not found (inherited by '" + current + "')",
                  arch_id, chain);
    }
    current = parent;
  }
  std::reverse(chain.begin(), chain.end());

  ResolutionResult result;
  FlattenedArchitecture& flat = result.architecture;
  flat.arch_id = arch_id;
  flat.inheritance_chain = chain;

  ConstraintAccumulator accumulator(result.conflicts);
  std::set<std::string> applied;
  std::set<std::string> seen_hints;
  std::set<std::string> seen_pointers;

  for (std::size_t i = 0; i < chain.size(); ++i) {
    const std::string& node_id = chain[i];
    const registry::ArchitectureNode& node = *registry.find_node(node_id);
    const bool is_leaf = i + 1 == chain.size();
    accumulator.begin_node(i);

    std::vector<std::string> mixin_ids = node.mixins;
    const std::size_t registry_mixin_count = mixin_ids.size();
    if (is_leaf) {
      for (const auto& inline_id : options.inline_mixins) {
        if (std::find(mixin_ids.begin(), mixin_ids.end(), inline_id) == mixin_ids.end()) {
          mixin_ids.push_back(inline_id);
        }
      }
    }

    for (std::size_t m = 0; m < mixin_ids.size(); ++m) {
      const std::string& mixin_id = mixin_ids[m];
      const registry::Mixin* mixin = registry.find_mixin(mixin_id);
      if (mixin == nullptr) {
        return fail(ResolutionErrorKind::kMixinNotFound,
                    "Mixin '" + mixin_id + "' not found (referenced by '" + node_id + "')",
                    arch_id, chain);
      }

      const bool used_inline = m >= registry_mixin_count;
      if (used_inline && mixin->inline_mode == registry::InlineMode::kForbidden) {
        result.conflicts.push_back(ConflictReport{
            "mixin_inline_forbidden", mixin_id, node_id, "",
            "Mixin '" + mixin_id +
                "' must not be applied inline; add it to the architecture's mixins instead",
            Severity::kWarning, std::nullopt});
      }
      if (!used_inline && mixin->inline_mode == registry::InlineMode::kOnly) {
        result.conflicts.push_back(ConflictReport{
            "mixin_inline_only", mixin_id, node_id, "",
            "Mixin '" + mixin_id + "' is inline-only but is listed in '" + node_id + "' mixins",
            Severity::kWarning, std::nullopt});
      }

      if (!applied.insert(mixin_id).second) {
        continue;
      }
      flat.applied_mixins.push_back(mixin_id);

      const std::string source = std::string(kMixinSourcePrefix) + mixin_id;
      for (const auto& constraint : mixin->constraints) {
        Constraint copy = constraint;
        copy.source = source;
        accumulator.add(std::move(copy), true);
      }
      append_hints(mixin->hints, seen_hints, flat.hints);
      append_pointers(mixin->pointers, seen_pointers, flat.pointers);
    }

    for (const auto& constraint : node.constraints) {
      Constraint copy = constraint;
      copy.source = node_id;
      accumulator.add(std::move(copy), false);
    }
    for (const auto& entry : node.exclude_constraints) {
      accumulator.exclude(entry, node_id);
    }
    append_hints(node.hints, seen_hints, flat.hints);
    append_pointers(node.pointers, seen_pointers, flat.pointers);

    if (!node.description.empty()) {
      flat.description = node.description;
    }
    if (!node.rationale.empty()) {
      flat.rationale = node.rationale;
    }
    if (!node.version.empty()) {
      flat.version = node.version;
    }
    if (node.deprecated_from.has_value()) {
      flat.deprecated_from = node.deprecated_from;
    }
    if (node.migration_guide.has_value()) {
      flat.migration_guide = node.migration_guide;
    }
    if (node.naming.has_value()) {
      flat.naming = node.naming;
    }
    if (!node.expected_intents.empty()) {
      flat.expected_intents = node.expected_intents;
    }
    if (is_leaf) {
      flat.singleton = node.singleton;
    }
  }

  accumulator.check_cross_rule_conflicts();
  flat.constraints = accumulator.take();
  return ResolveResult::ok(std::move(result));
}

}  // namespace archcheck::resolution
