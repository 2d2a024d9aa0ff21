#pragma once

#include "archcheck/constraints/project_view.h"
#include "archcheck/constraints/validator_registry.h"
#include "archcheck/core/clock.h"
#include "archcheck/core/id_generator.h"
#include "archcheck/registry/registry.h"
#include "archcheck/semantic/adapter_registry.h"
#include "archcheck/storage/audit_log.h"
#include "archcheck/validation/validation_config.h"
#include "archcheck/validation/validation_result.h"

#include <stop_token>
#include <string>
#include <vector>

namespace archcheck::validation {

// EngineServices bundles the engine's collaborators. It holds references (not ownership);
// the embedding application owns every instance and keeps it alive while the engine runs.
// project and audit_log are optional.
struct EngineServices {
  const registry::Registry& registry;                // NOLINT(readability-identifier-naming)
  const semantic::LanguageAdapterRegistry& adapters;  // NOLINT(readability-identifier-naming)
  const constraints::ValidatorRegistry& validators;  // NOLINT(readability-identifier-naming)
  core::IClock& clock;                               // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;                        // NOLINT(readability-identifier-naming)
  const constraints::IProjectView* project{nullptr};  // NOLINT(readability-identifier-naming)
  storage::IAuditLog* audit_log{nullptr};            // NOLINT(readability-identifier-naming)

  EngineServices(const registry::Registry& registry,
                 const semantic::LanguageAdapterRegistry& adapters,
                 const constraints::ValidatorRegistry& validators, core::IClock& clock,
                 core::IIdGenerator& id_gen, const constraints::IProjectView* project = nullptr,
                 storage::IAuditLog* audit_log = nullptr)
      : registry(registry),
        adapters(adapters),
        validators(validators),
        clock(clock),
        id_gen(id_gen),
        project(project),
        audit_log(audit_log) {}

  ~EngineServices() = default;

  EngineServices(const EngineServices&) = delete;
  EngineServices& operator=(const EngineServices&) = delete;
  EngineServices(EngineServices&&) = delete;
  EngineServices& operator=(EngineServices&&) = delete;
};

struct FileInput {
  std::string path;     // project-relative, '/'-separated
  std::string content;  // NOLINT(readability-identifier-naming)
};

// ValidationEngine checks files against the architecture their @arch tag names.
//
// Per file: tags -> untagged policy -> language adapter -> resolve -> per-constraint gating
// (skip_rules, capabilities, applies_when, unless, when, project context) -> validators ->
// overrides -> partition by severity. The verdict depends only on (path, content, Registry,
// config, today's date); audit events are written after the verdict is final.
class ValidationEngine {
 public:
  ValidationEngine(EngineServices& services, ValidationConfig config);

  [[nodiscard]] const ValidationConfig& config() const noexcept { return config_; }

  // Validates one file and writes its audit trace.
  [[nodiscard]] ValidationResult validate_file(const std::string& path,
                                               const std::string& content) const;

  // Validates files on a bounded worker pool. Results come back in input order; files not
  // started before stop was requested are reported kUnchecked. Adds the singleton check
  // across the batch, then writes audit traces in input order.
  [[nodiscard]] BatchValidationResult validate_files(const std::vector<FileInput>& files,
                                                     std::stop_token stop = {}) const;

 private:
  struct PreparedFile;

  [[nodiscard]] PreparedFile prepare(const std::string& path, const std::string& content) const;
  [[nodiscard]] ValidationResult evaluate(const PreparedFile& file, const std::string& today,
                                          const constraints::IProjectView* project) const;
  void check_singletons(std::vector<ValidationResult>& results) const;
  void record_audit(ValidationResult& result) const;

  EngineServices& services_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
  ValidationConfig config_;
};

}  // namespace archcheck::validation
