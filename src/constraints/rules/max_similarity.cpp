#include "archcheck/constraints/rules/max_similarity.h"

#include "archcheck/core/text.h"

#include <array>
#include <cmath>
#include <set>

namespace archcheck::constraints {

namespace {

struct StructuralSignature {
  std::set<std::string> exports;
  std::set<std::string> methods;
  std::set<std::string> classes;
  std::set<std::string> imports;
};

std::string import_key(const std::string& specifier) {
  std::string name = core::path_basename(specifier);
  if (name.size() > 3 && name.compare(name.size() - 3, 3, ".js") == 0) {
    name.resize(name.size() - 3);
  }
  return core::normalize_ascii_lower(name);
}

StructuralSignature signature_of(const semantic::SemanticModel& model) {
  StructuralSignature sig;
  for (const auto& exp : model.exports) {
    sig.exports.insert(core::normalize_ascii_lower(exp.name));
  }
  for (const auto& cls : model.classes) {
    sig.classes.insert(core::normalize_ascii_lower(cls.name));
    for (const auto& method : cls.methods) {
      if (!method.name.empty() && method.name.front() != '_') {
        sig.methods.insert(core::normalize_ascii_lower(method.name));
      }
    }
  }
  for (const auto& fn : model.functions) {
    if (!fn.name.empty() && fn.name.front() != '_') {
      sig.methods.insert(core::normalize_ascii_lower(fn.name));
    }
  }
  for (const auto& imp : model.imports) {
    sig.imports.insert(import_key(imp.module_specifier));
  }
  return sig;
}

// Jaccard index; -1 when both sets are empty so the dimension is left out of the weighting.
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
  if (a.empty() && b.empty()) {
    return -1.0;
  }
  std::size_t shared = 0;
  for (const auto& item : a) {
    shared += b.count(item);
  }
  const std::size_t combined = a.size() + b.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(combined);
}

}  // namespace

double structural_similarity(const semantic::SemanticModel& a, const semantic::SemanticModel& b) {
  const auto sa = signature_of(a);
  const auto sb = signature_of(b);
  const std::array<std::pair<double, double>, 4> dimensions{{
      {0.35, jaccard(sa.exports, sb.exports)},
      {0.35, jaccard(sa.methods, sb.methods)},
      {0.15, jaccard(sa.classes, sb.classes)},
      {0.15, jaccard(sa.imports, sb.imports)},
  }};
  double weighted = 0.0;
  double total_weight = 0.0;
  for (const auto& [weight, score] : dimensions) {
    if (score < 0.0) {
      continue;
    }
    weighted += weight * score;
    total_weight += weight;
  }
  return total_weight > 0.0 ? weighted / total_weight : 0.0;
}

ConstraintResult MaxSimilarityValidator::validate(const registry::Constraint& constraint,
                                                  const ConstraintContext& context) const {
  if (context.project == nullptr) {
    return {};
  }
  const auto threshold_value = registry::value_to_number(constraint.value);
  if (!threshold_value.has_value()) {
    return make_result({make_violation(constraint, context,
                                       "max_similarity requires a numeric threshold",
                                       std::nullopt, "Set the value to a number between 0 and 1")});
  }
  const double threshold = *threshold_value > 1.0 ? *threshold_value / 100.0 : *threshold_value;

  const std::string self = core::normalize_path(context.file_path);
  double best = -1.0;
  std::string best_path;
  for (const auto& peer : context.project->peers()) {
    if (peer.model == nullptr || peer.arch_id != context.arch_id ||
        core::normalize_path(peer.path) == self) {
      continue;
    }
    const double score = structural_similarity(context.parsed_file, *peer.model);
    if (score > best) {
      best = score;
      best_path = peer.path;
    }
  }
  if (best <= threshold) {
    return {};
  }

  const auto percent = [](const double v) {
    return std::to_string(static_cast<int>(std::lround(v * 100.0)));
  };
  return make_result({make_violation(
      constraint, context,
      "File is " + percent(best) + "% similar to '" + best_path + "' (maximum is " +
          percent(threshold) + "%)",
      semantic::SourceLocation{1, 1},
      "Extract the shared logic into a common module instead of duplicating it")});
}

}  // namespace archcheck::constraints
