#include "archcheck/constraints/rules/max_similarity.h"
#include "archcheck/constraints/rules/require_companion_file.h"
#include "archcheck/constraints/rules/require_coverage.h"
#include "archcheck/constraints/rules/require_test_file.h"
#include "archcheck/constraints/validator_registry.h"
#include "archcheck/core/text.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace archcheck;

static semantic::SemanticModel make_model(const std::string& path, const std::string& content = "") {
  semantic::SemanticModel model;
  model.file_path = path;
  model.file_name = core::path_basename(path);
  model.extension = core::path_extension(path);
  model.content = content;
  return model;
}

static registry::Constraint make_constraint(const std::string& rule, registry::ConstraintValue value) {
  registry::Constraint c;
  c.rule = rule;
  c.value = std::move(value);
  c.why = "Project conventions";
  c.source = "svc.payment";
  return c;
}

static constraints::ConstraintResult run(const constraints::ConstraintValidator& validator,
                                         const registry::Constraint& constraint,
                                         const semantic::SemanticModel& model,
                                         const constraints::IProjectView* project,
                                         const std::string& arch_id = "svc.payment") {
  const constraints::ConstraintContext context{model.file_path, model.file_name, arch_id,
                                               constraint.source, model, {}, {}, project};
  return validator.validate(constraint, context);
}

// ── require_test_file ───────────────────────────────────────────────────────

TEST_CASE("require_test_file: sibling or __tests__ test file satisfies the rule",
          "[rules][project]") {
  const auto model = make_model("src/payments/PaymentService.ts");
  const auto constraint = make_constraint("require_test_file", std::monostate{});

  constraints::InMemoryProjectView sibling;
  sibling.add_file("src/payments/PaymentService.test.ts", "");
  CHECK(run(constraints::RequireTestFileValidator{}, constraint, model, &sibling).passed);

  constraints::InMemoryProjectView nested;
  nested.add_file("src/payments/__tests__/PaymentService.spec.ts", "");
  CHECK(run(constraints::RequireTestFileValidator{}, constraint, model, &nested).passed);
}

TEST_CASE("require_test_file: missing test file lists every candidate", "[rules][project]") {
  const auto model = make_model("src/payments/PaymentService.ts");
  const constraints::InMemoryProjectView empty;
  const auto result = run(constraints::RequireTestFileValidator{},
                          make_constraint("require_test_file", std::monostate{}), model, &empty);
  REQUIRE(result.violations.size() == 1);
  CHECK(result.violations[0].code == "E011");
  CHECK(result.violations[0].message ==
        "No companion test file found for 'PaymentService.ts' (looked for: "
        "src/payments/PaymentService.test.ts, src/payments/__tests__/PaymentService.test.ts, "
        "src/payments/PaymentService.spec.ts, src/payments/__tests__/PaymentService.spec.ts)");
}

TEST_CASE("require_test_file: test files and missing project are skipped", "[rules][project]") {
  const constraints::InMemoryProjectView empty;
  const auto constraint = make_constraint("require_test_file", std::monostate{});
  CHECK(run(constraints::RequireTestFileValidator{}, constraint,
            make_model("src/payments/PaymentService.test.ts"), &empty)
            .passed);
  CHECK(run(constraints::RequireTestFileValidator{}, constraint,
            make_model("src/payments/PaymentService.ts"), nullptr)
            .passed);
}

// ── require_companion_file ──────────────────────────────────────────────────

TEST_CASE("require_companion_file: barrel must exist and re-export the file",
          "[rules][project]") {
  auto constraint = make_constraint("require_companion_file", std::monostate{});
  constraint.companion_files = {registry::CompanionFileSpec{"index.ts", true}};
  const auto model = make_model("src/payments/PaymentService.ts");

  const constraints::InMemoryProjectView missing;
  const auto absent = run(constraints::RequireCompanionFileValidator{}, constraint, model, &missing);
  REQUIRE(absent.violations.size() == 1);
  CHECK(absent.violations[0].code == "E026");
  CHECK(absent.violations[0].message ==
        "Missing companion file 'src/payments/index.ts' for 'PaymentService.ts'");
  REQUIRE(absent.violations[0].suggestion.has_value());
  CHECK(absent.violations[0].suggestion->replacement == "export * from './PaymentService';");

  constraints::InMemoryProjectView unrelated;
  unrelated.add_file("src/payments/index.ts", "export * from './RefundService';\n");
  const auto no_export =
      run(constraints::RequireCompanionFileValidator{}, constraint, model, &unrelated);
  REQUIRE(no_export.violations.size() == 1);
  CHECK(no_export.violations[0].message ==
        "Companion file 'src/payments/index.ts' does not export from './PaymentService'");

  constraints::InMemoryProjectView good;
  good.add_file("src/payments/index.ts", "export { PaymentService } from './PaymentService.js';\n");
  CHECK(run(constraints::RequireCompanionFileValidator{}, constraint, model, &good).passed);
}

TEST_CASE("require_companion_file: placeholders expand relative to the file", "[rules][project]") {
  const auto constraint =
      make_constraint("require_companion_file", std::string("${name:kebab}.stories.${ext}"));
  const auto model = make_model("src/ui/PaymentForm.tsx");

  constraints::InMemoryProjectView project;
  project.add_file("src/ui/payment-form.stories.tsx", "");
  CHECK(run(constraints::RequireCompanionFileValidator{}, constraint, model, &project).passed);

  const constraints::InMemoryProjectView empty;
  const auto result = run(constraints::RequireCompanionFileValidator{}, constraint, model, &empty);
  REQUIRE(result.violations.size() == 1);
  CHECK(result.violations[0].message ==
        "Missing companion file 'src/ui/payment-form.stories.tsx' for 'PaymentForm.tsx'");
}

TEST_CASE("require_companion_file: index and test files are exempt", "[rules][project]") {
  const auto constraint = make_constraint("require_companion_file", std::string("${name}.md"));
  const constraints::InMemoryProjectView empty;
  CHECK(run(constraints::RequireCompanionFileValidator{}, constraint,
            make_model("src/payments/index.ts"), &empty)
            .passed);
  CHECK(run(constraints::RequireCompanionFileValidator{}, constraint,
            make_model("src/payments/PaymentService.spec.ts"), &empty)
            .passed);
}

// ── FilesystemProjectView ───────────────────────────────────────────────────

namespace {

// Scratch project tree under the system temp directory, removed on destruction.
struct ScratchProject {
  std::filesystem::path root;

  explicit ScratchProject(const std::string& name)
      : root(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
  }
  ~ScratchProject() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }
  ScratchProject(const ScratchProject&) = delete;
  ScratchProject& operator=(const ScratchProject&) = delete;

  void write(const std::string& path, const std::string& content) const {
    const auto full = root / path;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    out << content;
  }
};

}  // namespace

TEST_CASE("FilesystemProjectView: exists, read and sorted relative listing", "[project_view]") {
  const ScratchProject scratch("archcheck_project_view_listing");
  scratch.write("src/payments/PaymentService.ts", "export class PaymentService {}\n");
  scratch.write("src/payments/PaymentService.test.ts", "");
  scratch.write("src/orders/__tests__/OrderService.test.ts", "");
  scratch.write("src/auth/AuthService.test.ts", "");
  std::filesystem::create_directories(scratch.root / "src/fixtures.test.ts");

  const constraints::FilesystemProjectView view(scratch.root);
  CHECK(view.exists("src/payments/PaymentService.ts"));
  CHECK(view.exists("./src/payments/PaymentService.ts"));
  CHECK_FALSE(view.exists("src/payments"));
  CHECK_FALSE(view.exists("src/payments/Missing.ts"));
  CHECK(view.read("src/payments/PaymentService.ts") ==
        std::optional<std::string>("export class PaymentService {}\n"));
  CHECK_FALSE(view.read("src/payments/Missing.ts").has_value());

  CHECK(view.list("**/*.test.ts") ==
        std::vector<std::string>{"src/auth/AuthService.test.ts",
                                 "src/orders/__tests__/OrderService.test.ts",
                                 "src/payments/PaymentService.test.ts"});
  CHECK(view.list("src/payments/*.ts") ==
        std::vector<std::string>{"src/payments/PaymentService.test.ts",
                                 "src/payments/PaymentService.ts"});
  CHECK(view.list("**/*.md").empty());
}

TEST_CASE("FilesystemProjectView: missing root reads as an empty project", "[project_view]") {
  const constraints::FilesystemProjectView view(std::filesystem::temp_directory_path() /
                                                "archcheck_project_view_missing_root");
  CHECK(view.list("**/*").empty());
  CHECK_FALSE(view.exists("src/a.ts"));
  CHECK_FALSE(view.read("src/a.ts").has_value());
}

TEST_CASE("require_test_file: resolved against files on disk", "[rules][project][project_view]") {
  const ScratchProject scratch("archcheck_project_view_test_file");
  scratch.write("src/payments/PaymentService.ts", "");
  scratch.write("src/payments/PaymentService.test.ts", "");
  scratch.write("src/orders/OrderService.ts", "");
  scratch.write("src/orders/__tests__/OrderService.spec.ts", "");
  scratch.write("src/auth/AuthService.ts", "");

  const constraints::FilesystemProjectView view(scratch.root);
  const auto constraint = make_constraint("require_test_file", std::monostate{});
  CHECK(run(constraints::RequireTestFileValidator{}, constraint,
            make_model("src/payments/PaymentService.ts"), &view)
            .passed);
  CHECK(run(constraints::RequireTestFileValidator{}, constraint,
            make_model("src/orders/OrderService.ts"), &view)
            .passed);

  const auto missing = run(constraints::RequireTestFileValidator{}, constraint,
                           make_model("src/auth/AuthService.ts"), &view);
  REQUIRE(missing.violations.size() == 1);
  CHECK(missing.violations[0].fix_hint ==
        "Create a test file such as 'src/auth/AuthService.test.ts'");
}

// ── require_coverage ────────────────────────────────────────────────────────

static registry::Constraint make_event_coverage() {
  registry::CoverageSpec spec;
  spec.source_type = "export_names";
  spec.source_pattern = "*Event";
  spec.in_files = "src/events/*.ts";
  spec.target_pattern = "case '${value}'";
  spec.in_target_files = "src/handlers/*.ts";
  auto constraint = make_constraint("require_coverage", std::monostate{});
  constraint.coverage = spec;
  return constraint;
}

static constraints::InMemoryProjectView make_event_project() {
  constraints::InMemoryProjectView project;
  project.add_file("src/events/order.ts",
                   "export const OrderCreatedEvent = 'order.created';\n"
                   "export const OrderShippedEvent = 'order.shipped';\n"
                   "export const orderTopic = 'orders';\n");
  project.add_file("src/events/user.ts", "export const UserDeletedEvent = 'user.deleted';\n");
  project.add_file("src/handlers/router.ts",
                   "switch (event) {\n  case 'OrderCreatedEvent':\n    break;\n}\n");
  return project;
}

TEST_CASE("require_coverage: source file reports only its own gaps", "[rules][coverage]") {
  const auto project = make_event_project();
  const auto model = make_model("src/events/order.ts");
  const auto result =
      run(constraints::RequireCoverageValidator{}, make_event_coverage(), model, &project);
  REQUIRE(result.violations.size() == 1);
  const auto& v = result.violations[0];
  CHECK(v.code == "E023");
  CHECK(v.message ==
        "Coverage gap: 'OrderShippedEvent' (src/events/order.ts:2) has no handler in "
        "src/handlers/*.ts");
  CHECK(v.line == std::optional<int>(2));
  CHECK(v.fix_hint == "Add a handler matching 'case 'OrderShippedEvent'' in src/handlers/*.ts");
}

TEST_CASE("require_coverage: other files report every gap without a location",
          "[rules][coverage]") {
  const auto project = make_event_project();
  const auto result = run(constraints::RequireCoverageValidator{}, make_event_coverage(),
                          make_model("src/handlers/router.ts"), &project);
  REQUIRE(result.violations.size() == 2);
  CHECK_FALSE(result.violations[0].line.has_value());
}

TEST_CASE("require_coverage: string literals with a transform", "[rules][coverage]") {
  registry::CoverageSpec spec;
  spec.source_type = "string_literals";
  spec.source_pattern = "COMMANDS = \\[([^\\]]*)\\]";
  spec.extract_values = "'([^']+)'";
  spec.in_files = "src/commands.ts";
  spec.target_pattern = "class ${value}Command";
  spec.transform = "PascalCase";
  spec.in_target_files = "src/commands/*.ts";
  auto constraint = make_constraint("require_coverage", std::monostate{});
  constraint.coverage = spec;

  constraints::InMemoryProjectView project;
  project.add_file("src/commands.ts", "export const COMMANDS = ['deploy-app', 'rollback'];\n");
  project.add_file("src/commands/deploy.ts", "export class DeployAppCommand {}\n");

  const auto result = run(constraints::RequireCoverageValidator{}, constraint,
                          make_model("src/commands.ts"), &project);
  REQUIRE(result.violations.size() == 1);
  CHECK(core::contains(result.violations[0].message, "'rollback'"));
}

TEST_CASE("require_coverage: missing spec is a configuration violation", "[rules][coverage]") {
  const constraints::InMemoryProjectView project;
  const auto result = run(constraints::RequireCoverageValidator{},
                          make_constraint("require_coverage", std::monostate{}),
                          make_model("src/a.ts"), &project);
  REQUIRE(result.violations.size() == 1);
  CHECK(result.violations[0].message == "require_coverage constraint has no coverage spec");
}

// ── max_similarity ──────────────────────────────────────────────────────────

static semantic::SemanticModel make_service(const std::string& path, const std::string& name) {
  auto model = make_model(path);
  model.exports = {semantic::ExportInfo{"PaymentService", semantic::ExportKind::kClass, false, {}}};
  semantic::ClassInfo cls;
  cls.name = name;
  for (const char* method : {"charge", "refund", "capture"}) {
    semantic::MethodInfo m;
    m.name = method;
    cls.methods.push_back(m);
  }
  model.classes.push_back(cls);
  semantic::ImportInfo db;
  db.module_specifier = "./db.js";
  model.imports.push_back(db);
  return model;
}

TEST_CASE("structural_similarity: identical structure scores one", "[rules][similarity]") {
  const auto a = make_service("src/a.ts", "PaymentService");
  CHECK(constraints::structural_similarity(a, a) == Catch::Approx(1.0));
  CHECK(constraints::structural_similarity(a, make_model("src/empty.ts")) == Catch::Approx(0.0));
}

TEST_CASE("max_similarity: near-duplicate peer of the same architecture", "[rules][similarity]") {
  const auto self = make_service("src/payments/PaymentService.ts", "PaymentService");
  constraints::InMemoryProjectView project;
  project.add_model(self, "svc.payment");
  project.add_model(make_service("src/payments/LegacyPaymentService.ts", "PaymentService"),
                    "svc.payment");

  const auto result = run(constraints::MaxSimilarityValidator{},
                          make_constraint("max_similarity", 0.8), self, &project);
  REQUIRE(result.violations.size() == 1);
  CHECK(result.violations[0].code == "E024");
  CHECK(result.violations[0].message ==
        "File is 100% similar to 'src/payments/LegacyPaymentService.ts' (maximum is 80%)");

  // Percent form of the threshold and peers of other architectures.
  CHECK_FALSE(run(constraints::MaxSimilarityValidator{}, make_constraint("max_similarity", 80.0),
                  self, &project)
                  .passed);
  CHECK(run(constraints::MaxSimilarityValidator{}, make_constraint("max_similarity", 0.8), self,
            &project, "svc.refund")
            .passed);
}

// ── registry ────────────────────────────────────────────────────────────────

TEST_CASE("make_default_validator_registry: every built-in rule is registered",
          "[validator_registry]") {
  const auto registry = constraints::make_default_validator_registry();
  CHECK(registry.size() == 24);
  for (const char* rule :
       {"must_extend", "implements", "forbid_import", "require_import", "require_decorator",
        "forbid_decorator", "naming_pattern", "location_pattern", "max_public_methods",
        "max_file_lines", "require_test_file", "forbid_call", "require_try_catch",
        "forbid_mutation", "require_call", "require_pattern", "require_export",
        "require_call_before", "forbid_pattern", "require_one_of", "require_coverage",
        "max_similarity", "require_companion_call", "require_companion_file"}) {
    INFO(rule);
    CHECK(registry.has(rule));
  }
  CHECK(registry.find("no_such_rule") == nullptr);
  REQUIRE(registry.find("max_similarity") != nullptr);
  CHECK(registry.find("max_similarity")->requires_project());
  CHECK_FALSE(registry.find("forbid_import")->requires_project());
  CHECK(registry.find("must_extend")->error_code() == "E001");
}

TEST_CASE("ValidatorRegistry: later registration replaces the rule", "[validator_registry]") {
  constraints::ValidatorRegistry registry;
  registry.register_validator(std::make_unique<constraints::RequireTestFileValidator>());
  registry.register_validator(std::make_unique<constraints::RequireTestFileValidator>());
  registry.register_validator(nullptr);
  CHECK(registry.size() == 1);
  CHECK(registry.rules() == std::vector<std::string>{"require_test_file"});
}
