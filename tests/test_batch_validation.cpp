#include "archcheck/validation/validation_engine.h"

#include "fake_language_adapter.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stop_token>

using namespace archcheck;
using validation::FileInput;
using validation::FileStatus;

static registry::Constraint make_constraint(const std::string& rule, registry::ConstraintValue value) {
  registry::Constraint c;
  c.rule = rule;
  c.value = std::move(value);
  c.why = "Layering";
  return c;
}

static registry::Registry make_registry() {
  registry::Registry reg;
  registry::ArchitectureNode payment;
  payment.constraints.push_back(make_constraint("must_extend", std::string("BaseService")));
  reg.nodes["svc.payment"] = payment;

  registry::ArchitectureNode config;
  config.singleton = true;
  reg.nodes["app.config"] = config;
  return reg;
}

namespace {

struct BatchHarness {
  registry::Registry registry = make_registry();
  semantic::LanguageAdapterRegistry adapters;
  constraints::ValidatorRegistry validators = constraints::make_default_validator_registry();
  core::FixedClock clock{"2026-06-01T09:00:00Z"};
  core::DeterministicIdGenerator ids;
  storage::InMemoryAuditLog audit_log;
  constraints::InMemoryProjectView project;
  validation::EngineServices services;

  explicit BatchHarness(bool with_project = false)
      : services(registry, adapters, validators, clock, ids, with_project ? &project : nullptr,
                 &audit_log) {
    adapters.register_adapter(std::make_shared<testing::FakeLanguageAdapter>(), {".ts"});
  }

  [[nodiscard]] validation::BatchValidationResult run(const std::vector<FileInput>& files,
                                                      validation::ValidationConfig config = {},
                                                      std::stop_token stop = {}) {
    const validation::ValidationEngine engine{services, std::move(config)};
    return engine.validate_files(files, std::move(stop));
  }
};

}  // namespace

static const std::string kGoodService =
    "// @arch svc.payment\nexport class PaymentService extends BaseService {\n}\n";
static const std::string kBadService = "// @arch svc.payment\nexport class PaymentService {\n}\n";

// ── Ordering and summary ────────────────────────────────────────────────────

TEST_CASE("validate_files: results follow input order with a summary", "[batch]") {
  BatchHarness harness;
  const std::vector<FileInput> files{
      {"src/a/PaymentService.ts", kGoodService},
      {"src/b/PaymentService.ts", kBadService},
      {"src/util.ts", "export const x = 1;\n"},
      {"tools/run.py", "# @arch svc.payment\n"},
  };

  const auto batch = harness.run(files);
  CHECK_FALSE(batch.cancelled);
  REQUIRE(batch.results.size() == 4);
  CHECK(batch.results[0].status == FileStatus::kPass);
  CHECK(batch.results[1].status == FileStatus::kFail);
  CHECK(batch.results[2].status == FileStatus::kUntagged);
  CHECK(batch.results[3].status == FileStatus::kUnchecked);

  CHECK(batch.summary.total == 4);
  CHECK(batch.summary.passed == 1);
  CHECK(batch.summary.failed == 1);
  CHECK(batch.summary.untagged == 1);
  CHECK(batch.summary.unchecked == 1);
  CHECK(batch.summary.total_errors == 1);
  CHECK(batch.summary.total_warnings == 0);
}

TEST_CASE("validate_files: worker pool keeps input order", "[batch]") {
  BatchHarness harness;
  std::vector<FileInput> files;
  for (int i = 0; i < 24; ++i) {
    files.push_back({"src/s" + std::to_string(i) + "/PaymentService.ts",
                     i % 3 == 0 ? kBadService : kGoodService});
  }
  validation::ValidationConfig config;
  config.concurrency = 4;

  const auto batch = harness.run(files, config);
  REQUIRE(batch.results.size() == files.size());
  for (std::size_t i = 0; i < files.size(); ++i) {
    CHECK(batch.results[i].file == files[i].path);
    CHECK(batch.results[i].passed == (i % 3 != 0));
  }
  CHECK(batch.summary.failed == 8);
}

TEST_CASE("validate_files: audit traces are written in input order", "[batch][audit]") {
  BatchHarness harness;
  const std::vector<FileInput> files{
      {"src/b/PaymentService.ts", kBadService},
      {"src/a/PaymentService.ts", kGoodService},
  };
  validation::ValidationConfig config;
  config.concurrency = 2;
  (void)harness.run(files, config);

  std::vector<std::string> validated;
  for (const auto& event : harness.audit_log.query("")) {
    if (event.event_type == "FileValidated") {
      validated.push_back(event.refs.front());
    }
  }
  CHECK(validated == std::vector<std::string>{"src/b/PaymentService.ts", "src/a/PaymentService.ts"});
  CHECK(harness.audit_log.list_trace_ids().size() == 2);
}

// ── Singletons ──────────────────────────────────────────────────────────────

TEST_CASE("validate_files: singleton architecture used by several files", "[batch][singleton]") {
  BatchHarness harness;
  const std::vector<FileInput> files{
      {"src/config/a.ts", "// @arch app.config\nexport const a = 1;\n"},
      {"src/config/b.ts", "// @arch app.config\nexport const b = 2;\n"},
  };

  const auto batch = harness.run(files);
  REQUIRE(batch.results.size() == 2);
  for (const auto& result : batch.results) {
    CHECK(result.status == FileStatus::kFail);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].code == "E027");
    CHECK(result.violations[0].rule == "singleton_violation");
    CHECK(result.violations[0].message ==
          "Architecture 'app.config' is marked singleton but is used by 2 files: a.ts, b.ts");
    CHECK(result.violations[0].line == std::optional<int>(1));
  }
  CHECK(batch.summary.failed == 2);
}

TEST_CASE("validate_files: single use of a singleton passes", "[batch][singleton]") {
  BatchHarness harness;
  const auto batch = harness.run({{"src/config/a.ts", "// @arch app.config\nexport const a = 1;\n"}});
  REQUIRE(batch.results.size() == 1);
  CHECK(batch.results[0].status == FileStatus::kPass);
}

// ── Cancellation ────────────────────────────────────────────────────────────

TEST_CASE("validate_files: stop before start leaves every file unchecked", "[batch][cancel]") {
  BatchHarness harness;
  const std::vector<FileInput> files{
      {"src/a/PaymentService.ts", kGoodService},
      {"src/b/PaymentService.ts", kBadService},
      {"src/c/PaymentService.ts", kGoodService},
  };
  std::stop_source source;
  source.request_stop();

  const auto batch = harness.run(files, {}, source.get_token());
  CHECK(batch.cancelled);
  REQUIRE(batch.results.size() == 3);
  for (std::size_t i = 0; i < files.size(); ++i) {
    CHECK(batch.results[i].file == files[i].path);
    CHECK(batch.results[i].status == FileStatus::kUnchecked);
    CHECK_FALSE(batch.results[i].passed);
    CHECK(batch.results[i].unchecked_reason == std::optional<std::string>("Validation cancelled"));
  }
  CHECK(batch.summary.unchecked == 3);
}

// ── Peers ───────────────────────────────────────────────────────────────────

TEST_CASE("validate_files: max_similarity compares files of the batch", "[batch][similarity]") {
  BatchHarness harness(true);
  harness.registry.nodes["svc.payment"].constraints.push_back(make_constraint("max_similarity", 0.8));

  const std::string body =
      "// @arch svc.payment\n"
      "export class PaymentService extends BaseService {\n"
      "  charge() {\n"
      "  }\n"
      "  refund() {\n"
      "  }\n"
      "}\n";
  const std::vector<FileInput> files{{"src/a/PaymentService.ts", body},
                                     {"src/b/PaymentService.ts", body}};

  const auto batch = harness.run(files);
  REQUIRE(batch.results.size() == 2);
  REQUIRE(batch.results[0].violations.size() == 1);
  CHECK(batch.results[0].violations[0].code == "E024");
  CHECK(batch.results[0].violations[0].message ==
        "File is 100% similar to 'src/b/PaymentService.ts' (maximum is 80%)");
  REQUIRE(batch.results[1].violations.size() == 1);
  CHECK(batch.results[1].violations[0].message ==
        "File is 100% similar to 'src/a/PaymentService.ts' (maximum is 80%)");
}

TEST_CASE("validate_files: cross-file rules are skipped without a project", "[batch][similarity]") {
  BatchHarness harness;
  harness.registry.nodes["svc.payment"].constraints.push_back(make_constraint("max_similarity", 0.8));

  const auto batch = harness.run({{"src/a/PaymentService.ts", kGoodService},
                                  {"src/b/PaymentService.ts", kGoodService}});
  for (const auto& result : batch.results) {
    CHECK(result.status == FileStatus::kPass);
    REQUIRE(result.skipped.size() == 1);
    CHECK(result.skipped[0].reason == validation::SkipReason::kProjectContextRequired);
  }
}
