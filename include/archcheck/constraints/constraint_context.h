#pragma once

#include "archcheck/constraints/project_view.h"
#include "archcheck/semantic/semantic_model.h"
#include "archcheck/tags/arch_tag.h"

#include <string>
#include <vector>

namespace archcheck::constraints {

// Evaluation scope for one (file, constraint) pair. Built fresh for every call and never
// shared between constraints.
struct ConstraintContext {
  std::string file_path;
  std::string file_name;
  std::string arch_id;
  std::string constraint_source;
  const semantic::SemanticModel& parsed_file;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
  // File-level intent names.
  std::vector<std::string> intents;
  // Every @intent annotation with its line, for function-level lookups.
  std::vector<tags::IntentAnnotation> intent_annotations;
  // Null when the caller supplies no project; cross-file rules are then skipped.
  const IProjectView* project{nullptr};
};

}  // namespace archcheck::constraints
