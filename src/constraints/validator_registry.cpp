#include "archcheck/constraints/validator_registry.h"

#include "archcheck/constraints/rules/forbid_call.h"
#include "archcheck/constraints/rules/forbid_decorator.h"
#include "archcheck/constraints/rules/forbid_import.h"
#include "archcheck/constraints/rules/forbid_mutation.h"
#include "archcheck/constraints/rules/forbid_pattern.h"
#include "archcheck/constraints/rules/implements.h"
#include "archcheck/constraints/rules/location_pattern.h"
#include "archcheck/constraints/rules/max_file_lines.h"
#include "archcheck/constraints/rules/max_public_methods.h"
#include "archcheck/constraints/rules/max_similarity.h"
#include "archcheck/constraints/rules/must_extend.h"
#include "archcheck/constraints/rules/naming_pattern.h"
#include "archcheck/constraints/rules/require_call.h"
#include "archcheck/constraints/rules/require_call_before.h"
#include "archcheck/constraints/rules/require_companion_call.h"
#include "archcheck/constraints/rules/require_companion_file.h"
#include "archcheck/constraints/rules/require_coverage.h"
#include "archcheck/constraints/rules/require_decorator.h"
#include "archcheck/constraints/rules/require_export.h"
#include "archcheck/constraints/rules/require_import.h"
#include "archcheck/constraints/rules/require_one_of.h"
#include "archcheck/constraints/rules/require_pattern.h"
#include "archcheck/constraints/rules/require_test_file.h"
#include "archcheck/constraints/rules/require_try_catch.h"

#include <utility>

namespace archcheck::constraints {

void ValidatorRegistry::register_validator(std::unique_ptr<const ConstraintValidator> validator) {
  if (validator == nullptr) {
    return;
  }
  std::string rule{validator->rule()};
  validators_[std::move(rule)] = std::move(validator);
}

const ConstraintValidator* ValidatorRegistry::find(const std::string_view rule) const {
  const auto it = validators_.find(rule);
  return it == validators_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ValidatorRegistry::rules() const {
  std::vector<std::string> out;
  out.reserve(validators_.size());
  for (const auto& [rule, _] : validators_) {
    out.push_back(rule);
  }
  return out;
}

ValidatorRegistry make_default_validator_registry() {
  ValidatorRegistry registry;
  registry.register_validator(std::make_unique<MustExtendValidator>());
  registry.register_validator(std::make_unique<ImplementsValidator>());
  registry.register_validator(std::make_unique<ForbidImportValidator>());
  registry.register_validator(std::make_unique<RequireImportValidator>());
  registry.register_validator(std::make_unique<RequireDecoratorValidator>());
  registry.register_validator(std::make_unique<ForbidDecoratorValidator>());
  registry.register_validator(std::make_unique<NamingPatternValidator>());
  registry.register_validator(std::make_unique<LocationPatternValidator>());
  registry.register_validator(std::make_unique<MaxPublicMethodsValidator>());
  registry.register_validator(std::make_unique<MaxFileLinesValidator>());
  registry.register_validator(std::make_unique<RequireTestFileValidator>());
  registry.register_validator(std::make_unique<ForbidCallValidator>());
  registry.register_validator(std::make_unique<RequireTryCatchValidator>());
  registry.register_validator(std::make_unique<ForbidMutationValidator>());
  registry.register_validator(std::make_unique<RequireCallValidator>());
  registry.register_validator(std::make_unique<RequirePatternValidator>());
  registry.register_validator(std::make_unique<RequireExportValidator>());
  registry.register_validator(std::make_unique<RequireCallBeforeValidator>());
  registry.register_validator(std::make_unique<ForbidPatternValidator>());
  registry.register_validator(std::make_unique<RequireOneOfValidator>());
  registry.register_validator(std::make_unique<RequireCoverageValidator>());
  registry.register_validator(std::make_unique<MaxSimilarityValidator>());
  registry.register_validator(std::make_unique<RequireCompanionCallValidator>());
  registry.register_validator(std::make_unique<RequireCompanionFileValidator>());
  return registry;
}

}  // namespace archcheck::constraints
