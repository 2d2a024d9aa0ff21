#include "archcheck/core/version.h"
#include "archcheck/storage/audit_chain.h"
#include "archcheck/validation/validation_engine.h"

#include "fake_language_adapter.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>

using namespace archcheck;
using registry::Severity;
using validation::FileStatus;
using validation::SkipReason;

static registry::Constraint make_constraint(const std::string& rule, registry::ConstraintValue value,
                                            const std::string& why = "Layering") {
  registry::Constraint c;
  c.rule = rule;
  c.value = std::move(value);
  c.why = why;
  return c;
}

// base: forbid axios.  svc.payment: must extend BaseService.
static registry::Registry make_registry() {
  registry::Registry reg;

  registry::ArchitectureNode base;
  base.description = "Any source file";
  base.constraints.push_back(make_constraint("forbid_import", std::string("axios")));
  reg.nodes["base"] = base;

  registry::ArchitectureNode payment;
  payment.inherits = "base";
  payment.constraints.push_back(make_constraint("must_extend", std::string("BaseService")));
  reg.nodes["svc.payment"] = payment;

  registry::Mixin audited;
  audited.inline_mode = registry::InlineMode::kForbidden;
  reg.mixins["audited"] = audited;
  return reg;
}

namespace {

struct EngineHarness {
  registry::Registry registry;
  semantic::LanguageAdapterRegistry adapters;
  constraints::ValidatorRegistry validators = constraints::make_default_validator_registry();
  core::FixedClock clock{"2026-06-01T09:00:00Z"};
  core::DeterministicIdGenerator ids;
  storage::InMemoryAuditLog audit_log;
  constraints::InMemoryProjectView project;
  validation::EngineServices services;

  explicit EngineHarness(registry::Registry reg = make_registry(), bool with_project = false)
      : registry(std::move(reg)),
        services(registry, adapters, validators, clock, ids, with_project ? &project : nullptr,
                 &audit_log) {
    adapters.register_adapter(std::make_shared<testing::FakeLanguageAdapter>(), {".ts"});
  }

  [[nodiscard]] validation::ValidationResult validate(const std::string& path,
                                                      const std::string& content,
                                                      validation::ValidationConfig config = {}) {
    const validation::ValidationEngine engine{services, std::move(config)};
    return engine.validate_file(path, content);
  }
};

}  // namespace

static bool has_code(const std::vector<constraints::Violation>& findings, const std::string& code) {
  return std::any_of(findings.begin(), findings.end(),
                     [&](const constraints::Violation& v) { return v.code == code; });
}

static const validation::SkippedConstraint* find_skip(const validation::ValidationResult& result,
                                                      const std::string& rule) {
  for (const auto& skipped : result.skipped) {
    if (skipped.rule == rule) {
      return &skipped;
    }
  }
  return nullptr;
}

// ── End to end ──────────────────────────────────────────────────────────────

TEST_CASE("validate_file: inherited must_extend reports a missing base class", "[engine]") {
  EngineHarness harness;
  const auto result = harness.validate("src/payments/PaymentService.ts",
                                       "/** @arch svc.payment */\nexport class PaymentService {\n}\n");

  CHECK(result.status == FileStatus::kFail);
  CHECK_FALSE(result.passed);
  CHECK(result.arch_id == std::optional<std::string>("svc.payment"));
  CHECK(result.inheritance_chain == std::vector<std::string>{"base", "svc.payment"});
  REQUIRE(result.violations.size() == 1);
  const auto& v = result.violations[0];
  CHECK(v.code == "E001");
  CHECK(v.message.find("has no base class") != std::string::npos);
  CHECK(v.source == "svc.payment");
  CHECK(v.line == std::optional<int>(2));
  CHECK(result.warnings.empty());
}

TEST_CASE("validate_file: compliant file passes", "[engine]") {
  EngineHarness harness;
  const auto result = harness.validate(
      "src/payments/PaymentService.ts",
      "/** @arch svc.payment */\nimport { Injectable } from '@nestjs/common';\n"
      "export class PaymentService extends BaseService {\n}\n");
  CHECK(result.status == FileStatus::kPass);
  CHECK(result.passed);
  CHECK(result.violations.empty());
}

TEST_CASE("validate_file: inherited and leaf violations are sorted by line", "[engine]") {
  EngineHarness harness;
  const auto result = harness.validate("src/payments/PaymentService.ts",
                                       "// @arch svc.payment\n"
                                       "export class PaymentService {\n"
                                       "}\n"
                                       "import axios from 'axios';\n");
  REQUIRE(result.violations.size() == 2);
  CHECK(result.violations[0].code == "E001");
  CHECK(result.violations[1].code == "E003");
  CHECK(result.violations[1].source == "base");
}

// ── Untagged and unchecked ──────────────────────────────────────────────────

TEST_CASE("validate_file: untagged policy", "[engine][untagged]") {
  EngineHarness harness;
  const std::string content = "export const x = 1;\n";

  SECTION("allow") {
    const auto result = harness.validate("src/x.ts", content);
    CHECK(result.status == FileStatus::kUntagged);
    CHECK(result.passed);
    CHECK(result.violations.empty());
    CHECK(result.warnings.empty());
  }

  SECTION("warn") {
    validation::ValidationConfig config;
    config.untagged_policy = validation::UntaggedPolicy::kWarn;
    const auto result = harness.validate("src/x.ts", content, config);
    CHECK(result.status == FileStatus::kUntagged);
    CHECK(result.passed);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].code == "S001");
  }

  SECTION("deny") {
    validation::ValidationConfig config;
    config.untagged_policy = validation::UntaggedPolicy::kDeny;
    const auto result = harness.validate("src/x.ts", content, config);
    CHECK(result.status == FileStatus::kUntagged);
    CHECK_FALSE(result.passed);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].message ==
          "Missing @arch tag. Use /** @arch domain.name */ or // @arch domain.name");
  }

  SECTION("files in an unsupported language are judged by tag first") {
    validation::ValidationConfig config;
    config.untagged_policy = validation::UntaggedPolicy::kDeny;
    const auto result = harness.validate("tools/run.py", "print('x')\n", config);
    CHECK(result.status == FileStatus::kUntagged);
    CHECK_FALSE(result.passed);
  }
}

TEST_CASE("validate_file: missing adapter or parse failure leaves the file unchecked",
          "[engine][unchecked]") {
  EngineHarness harness;

  const auto no_adapter = harness.validate("tools/run.py", "# @arch svc.payment\nprint('x')\n");
  CHECK(no_adapter.status == FileStatus::kUnchecked);
  CHECK_FALSE(no_adapter.passed);
  CHECK(no_adapter.unchecked_reason ==
        std::optional<std::string>("No language adapter registered for '.py' files"));

  const auto broken = harness.validate("src/a.ts", "// @arch svc.payment\n<<<syntax error>>>\n");
  CHECK(broken.status == FileStatus::kUnchecked);
  CHECK_FALSE(broken.passed);
  CHECK(broken.unchecked_reason ==
        std::optional<std::string>("Could not parse file: Unexpected token"));
  CHECK(broken.violations.empty());
}

// ── Resolution ──────────────────────────────────────────────────────────────

TEST_CASE("validate_file: unknown architecture is S002 at the tag line", "[engine][resolution]") {
  EngineHarness harness;
  const auto result = harness.validate("src/a.ts", "\n// @arch svc.unknown\nexport const a = 1;\n");
  CHECK(result.status == FileStatus::kFail);
  REQUIRE(result.violations.size() == 1);
  const auto& v = result.violations[0];
  CHECK(v.code == "S002");
  CHECK(v.rule == "resolution");
  CHECK(v.source == "registry");
  CHECK(v.message == "Architecture 'svc.unknown' not found in registry");
  CHECK(v.line == std::optional<int>(2));
}

TEST_CASE("validate_file: circular inheritance and missing mixin", "[engine][resolution]") {
  auto reg = make_registry();
  registry::ArchitectureNode a;
  a.inherits = "b";
  registry::ArchitectureNode b;
  b.inherits = "a";
  reg.nodes["a"] = a;
  reg.nodes["b"] = b;
  registry::ArchitectureNode mixed;
  mixed.mixins = {"ghost"};
  reg.nodes["mixed"] = mixed;
  EngineHarness harness(std::move(reg));

  CHECK(has_code(harness.validate("src/a.ts", "// @arch a\n").violations, "S003"));
  CHECK(has_code(harness.validate("src/m.ts", "// @arch mixed\n").violations, "S004"));
}

TEST_CASE("validate_file: inline use of a forbidden-inline mixin warns", "[engine][resolution]") {
  EngineHarness harness;
  const auto result = harness.validate(
      "src/PaymentService.ts",
      "// @arch svc.payment +audited\nexport class PaymentService extends BaseService {\n}\n");
  CHECK(result.status == FileStatus::kWarn);
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].code == "E027");
  CHECK(result.warnings[0].rule == "mixin_inline_forbidden");
  CHECK(result.mixins_applied == std::vector<std::string>{"audited"});
}

TEST_CASE("validate_file: deprecated architecture and expected intents", "[engine][resolution]") {
  auto reg = make_registry();
  reg.nodes["svc.payment"].deprecated_from = "2.0";
  reg.nodes["svc.payment"].migration_guide = "docs/payments-v3.md";
  reg.nodes["svc.payment"].expected_intents = {"pci-scope"};
  EngineHarness harness(std::move(reg));

  const std::string content =
      "// @arch svc.payment\nexport class PaymentService extends BaseService {\n}\n";
  const auto result = harness.validate("src/PaymentService.ts", content);
  CHECK(result.status == FileStatus::kWarn);
  CHECK(result.passed);
  REQUIRE(result.warnings.size() == 2);
  CHECK(has_code(result.warnings, "W001"));
  CHECK(has_code(result.warnings, "E028"));

  SECTION("strict mode fails on warnings") {
    validation::ValidationConfig config;
    config.strict = true;
    const auto strict = harness.validate("src/PaymentService.ts", content, config);
    CHECK(strict.status == FileStatus::kFail);
    CHECK(strict.violations.size() == 2);
    CHECK(strict.warnings.empty());
  }
}

TEST_CASE("validate_file: unknown intents suggest close vocabulary entries", "[engine][intents]") {
  EngineHarness harness;
  validation::ValidationConfig config;
  config.known_intents = std::vector<std::string>{"cli-output", "admin-only"};
  const auto result = harness.validate(
      "src/PaymentService.ts",
      "// @arch svc.payment\n// @intent:cli-outpt\nexport class PaymentService extends BaseService {\n}\n",
      config);
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].code == "I001");
  CHECK(result.warnings[0].message ==
        "Unknown intent '@intent:cli-outpt'. Did you mean: cli-output?");
  CHECK(result.warnings[0].line == std::optional<int>(2));
}

// ── Constraint gating ───────────────────────────────────────────────────────

TEST_CASE("validate_file: skip_rules and severity filters", "[engine][gating]") {
  EngineHarness harness;
  const std::string content = "// @arch svc.payment\nexport class PaymentService {\n}\n";

  validation::ValidationConfig skip;
  skip.skip_rules = {"must_extend"};
  const auto skipped = harness.validate("src/PaymentService.ts", content, skip);
  CHECK(skipped.status == FileStatus::kPass);
  const auto* entry = find_skip(skipped, "must_extend");
  REQUIRE(entry != nullptr);
  CHECK(entry->reason == SkipReason::kFiltered);

  validation::ValidationConfig warnings_only;
  warnings_only.severities = {Severity::kWarning};
  const auto filtered = harness.validate("src/PaymentService.ts", content, warnings_only);
  CHECK(filtered.status == FileStatus::kPass);
  CHECK(filtered.skipped.size() == 2);
}

TEST_CASE("validate_file: language capabilities gate rules", "[engine][gating]") {
  EngineHarness harness;
  semantic::LanguageCapabilities no_inheritance;
  no_inheritance.has_class_inheritance = false;
  harness.adapters.register_adapter(std::make_shared<testing::FakeLanguageAdapter>(), {".go"},
                                    no_inheritance);

  const auto result =
      harness.validate("svc/payment.go", "// @arch svc.payment\nexport class PaymentService {\n}\n");
  CHECK(result.status == FileStatus::kPass);
  const auto* entry = find_skip(result, "must_extend");
  REQUIRE(entry != nullptr);
  CHECK(entry->reason == SkipReason::kCapability);
}

TEST_CASE("validate_file: applies_when, unless and when", "[engine][gating]") {
  auto reg = make_registry();
  auto& payment = reg.nodes["svc.payment"].constraints.front();
  const std::string content =
      "// @arch svc.payment\n// @intent:legacy\nexport class PaymentService {\n}\n";

  SECTION("applies_when not found skips") {
    payment.applies_when = "@Injectable";
    EngineHarness harness(std::move(reg));
    const auto result = harness.validate("src/PaymentService.ts", content);
    CHECK(result.status == FileStatus::kPass);
    REQUIRE(find_skip(result, "must_extend") != nullptr);
    CHECK(find_skip(result, "must_extend")->reason == SkipReason::kAppliesWhen);
  }

  SECTION("invalid applies_when is S005") {
    payment.applies_when = "([";
    EngineHarness harness(std::move(reg));
    const auto result = harness.validate("src/PaymentService.ts", content);
    CHECK(result.status == FileStatus::kFail);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].code == "S005");
    CHECK(result.violations[0].rule == "must_extend");
  }

  SECTION("unless intent skips") {
    payment.unless = {"@intent:legacy"};
    EngineHarness harness(std::move(reg));
    const auto result = harness.validate("src/PaymentService.ts", content);
    CHECK(result.status == FileStatus::kPass);
    REQUIRE(find_skip(result, "must_extend") != nullptr);
    CHECK(find_skip(result, "must_extend")->reason == SkipReason::kUnless);
  }

  SECTION("unmet when condition skips") {
    registry::ConstraintCondition when;
    when.has_decorator = "Injectable";
    payment.when = when;
    EngineHarness harness(std::move(reg));
    const auto result = harness.validate("src/PaymentService.ts", content);
    CHECK(result.status == FileStatus::kPass);
    const auto* entry = find_skip(result, "must_extend");
    REQUIRE(entry != nullptr);
    CHECK(entry->reason == SkipReason::kCondition);
  }
}

TEST_CASE("validate_file: cross-file rules need a project view", "[engine][gating]") {
  auto reg = make_registry();
  reg.nodes["svc.payment"].constraints.push_back(
      make_constraint("require_test_file", std::monostate{}));
  const std::string content =
      "// @arch svc.payment\nexport class PaymentService extends BaseService {\n}\n";

  EngineHarness without(reg);
  const auto skipped = without.validate("src/PaymentService.ts", content);
  CHECK(skipped.status == FileStatus::kPass);
  REQUIRE(find_skip(skipped, "require_test_file") != nullptr);
  CHECK(find_skip(skipped, "require_test_file")->reason == SkipReason::kProjectContextRequired);

  EngineHarness with(reg, true);
  const auto checked = with.validate("src/PaymentService.ts", content);
  CHECK(checked.status == FileStatus::kFail);
  CHECK(has_code(checked.violations, "E011"));

  with.project.add_file("src/PaymentService.test.ts", "");
  CHECK(with.validate("src/PaymentService.ts", content).status == FileStatus::kPass);
}

TEST_CASE("validate_file: unknown rules are skipped, not failed", "[engine][gating]") {
  auto reg = make_registry();
  reg.nodes["svc.payment"].constraints.push_back(make_constraint("require_jsdoc", std::string("x")));
  EngineHarness harness(std::move(reg));
  const auto result = harness.validate(
      "src/PaymentService.ts",
      "// @arch svc.payment\nexport class PaymentService extends BaseService {\n}\n");
  CHECK(result.status == FileStatus::kPass);
  REQUIRE(find_skip(result, "require_jsdoc") != nullptr);
  CHECK(find_skip(result, "require_jsdoc")->reason == SkipReason::kNoValidator);
}

TEST_CASE("validate_file: forbid rules without a why are reported when configured",
          "[engine][gating]") {
  auto reg = make_registry();
  reg.nodes["base"].constraints.front().why.clear();
  EngineHarness harness(std::move(reg));
  const std::string content =
      "// @arch svc.payment\nexport class PaymentService extends BaseService {\n}\n";

  CHECK(harness.validate("src/PaymentService.ts", content).status == FileStatus::kPass);

  validation::ValidationConfig config;
  config.missing_why = validation::MissingWhyBehavior::kWarning;
  const auto result = harness.validate("src/PaymentService.ts", content, config);
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].code == "C001");
  CHECK(result.warnings[0].message ==
        "Constraint 'forbid_import' is missing 'why' field - explain why this is forbidden");
}

// ── Overrides ───────────────────────────────────────────────────────────────

static std::string file_with_override(const std::string& detail_lines) {
  return "/**\n"
         " * @arch svc.payment\n"
         " * @override forbid_import:axios\n" +
         detail_lines +
         " */\n"
         "import axios from 'axios';\n"
         "export class PaymentService extends BaseService {\n"
         "}\n";
}

TEST_CASE("validate_file: valid override suppresses the matching violation", "[engine][overrides]") {
  EngineHarness harness;
  const auto result =
      harness.validate("src/PaymentService.ts",
                       file_with_override(" * @reason Legacy client\n * @expires 2026-07-01\n"));
  CHECK(result.status == FileStatus::kPass);
  CHECK(result.violations.empty());
  REQUIRE(result.active_overrides.size() == 1);
  const auto& active = result.active_overrides[0];
  CHECK(active.rule == "forbid_import");
  CHECK(active.value == "axios");
  CHECK(active.reason == "Legacy client");
  CHECK(active.line == 3);
  CHECK(active.suppressed == 1);
}

TEST_CASE("validate_file: invalid override is reported and suppresses nothing",
          "[engine][overrides]") {
  EngineHarness harness;
  const auto result =
      harness.validate("src/PaymentService.ts", file_with_override(" * @expires 2026-07-01\n"));
  CHECK(result.status == FileStatus::kFail);
  CHECK(result.active_overrides.empty());
  REQUIRE(result.violations.size() == 2);
  CHECK(result.violations[0].code == "O003");
  CHECK(result.violations[0].line == std::optional<int>(3));
  CHECK(result.violations[1].code == "E003");
}

TEST_CASE("validate_file: expired override is never honored", "[engine][overrides]") {
  EngineHarness harness;
  validation::ValidationConfig config;
  config.override_policy.fail_on_expired = false;
  const auto result = harness.validate(
      "src/PaymentService.ts",
      file_with_override(" * @reason Legacy client\n * @expires 2026-01-01\n"), config);
  CHECK(result.status == FileStatus::kFail);
  CHECK(has_code(result.warnings, "O003"));
  CHECK(has_code(result.violations, "E003"));
}

TEST_CASE("validate_file: override limit per file", "[engine][overrides]") {
  EngineHarness harness;
  validation::ValidationConfig config;
  config.max_overrides_per_file = 1;
  const auto result = harness.validate(
      "src/PaymentService.ts",
      file_with_override(" * @reason Legacy client\n * @expires 2026-07-01\n"
                         " * @override must_extend:BaseService\n"
                         " * @reason Migration in progress\n * @expires 2026-07-01\n"),
      config);
  REQUIRE(result.violations.size() == 1);
  CHECK(result.violations[0].code == "O005");
  CHECK(result.violations[0].message == "File has 2 overrides, maximum is 1");
  CHECK(result.active_overrides.size() == 2);
}

// ── Audit ───────────────────────────────────────────────────────────────────

TEST_CASE("validate_file: writes one hash-chained trace per file", "[engine][audit]") {
  EngineHarness harness;
  const auto result =
      harness.validate("src/PaymentService.ts",
                       file_with_override(" * @reason Legacy client\n * @expires 2026-07-01\n"));
  CHECK_FALSE(result.audit_error.has_value());

  const auto traces = harness.audit_log.list_trace_ids();
  REQUIRE(traces.size() == 1);
  const auto events = harness.audit_log.query(traces[0]);
  REQUIRE(events.size() == 3);
  CHECK(events[0].event_type == "ArchitectureResolved");
  CHECK(events[1].event_type == "OverrideApplied");
  CHECK(events[2].event_type == "FileValidated");
  CHECK(events[2].refs == std::vector<std::string>{"src/PaymentService.ts", "svc.payment"});
  CHECK(events[2].created_at == "2026-06-01T09:00:00Z");

  const auto payload = nlohmann::json::parse(events[2].payload);
  CHECK(payload["status"] == "pass");
  CHECK(payload["error_count"] == 0);
  CHECK(payload["engine_version"] == core::kBuildVersion);

  const auto chain = storage::verify_audit_chain(events);
  CHECK(chain.valid);
  CHECK(chain.first_invalid_index == events.size());
}

TEST_CASE("validate_file: untagged files still get a FileValidated event", "[engine][audit]") {
  EngineHarness harness;
  (void)harness.validate("src/x.ts", "export const x = 1;\n");
  const auto events = harness.audit_log.query("");
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == "FileValidated");
  CHECK(events[0].refs == std::vector<std::string>{"src/x.ts"});
}
