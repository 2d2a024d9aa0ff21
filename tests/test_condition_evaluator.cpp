#include "archcheck/constraints/condition_evaluator.h"
#include "archcheck/constraints/intent_resolver.h"

#include <catch2/catch_test_macros.hpp>

using namespace archcheck;

static semantic::SemanticModel make_model() {
  semantic::SemanticModel model;
  model.file_path = "src/payments/PaymentController.ts";
  model.file_name = "PaymentController.ts";
  model.extension = ".ts";
  model.content = "export class PaymentController extends BaseController {}\n";

  semantic::ImportInfo http;
  http.module_specifier = "@nestjs/common";
  http.named_imports = {"Controller", "Get"};
  model.imports.push_back(http);

  semantic::ClassInfo cls;
  cls.name = "PaymentController";
  cls.is_exported = true;
  cls.extends = "BaseController";
  cls.implements = {"OnModuleInit"};
  cls.decorators = {semantic::DecoratorInfo{"Controller", {"'payments'"}, {}}};
  semantic::MethodInfo list;
  list.name = "list";
  list.decorators = {semantic::DecoratorInfo{"Get", {}, {}}};
  cls.methods.push_back(list);
  model.classes.push_back(cls);
  return model;
}

static constraints::ConstraintContext make_context(const semantic::SemanticModel& model,
                                                   std::vector<std::string> intents = {}) {
  return constraints::ConstraintContext{model.file_path, model.file_name, "api.controller",
                                        "api.controller", model, std::move(intents), {}, nullptr};
}

// ── when ────────────────────────────────────────────────────────────────────

TEST_CASE("evaluate_condition: every set field must hold", "[conditions]") {
  const auto model = make_model();
  registry::ConstraintCondition condition;
  condition.has_decorator = "@Controller";
  condition.extends = "BaseController";
  condition.file_matches = "src/**/*Controller.ts";

  const auto outcome = constraints::evaluate_condition(condition, model, model.file_path);
  CHECK(outcome.satisfied);
}

TEST_CASE("evaluate_condition: failing field names itself in the reason", "[conditions]") {
  const auto model = make_model();
  registry::ConstraintCondition condition;
  condition.implements = "OnModuleDestroy";

  const auto outcome = constraints::evaluate_condition(condition, model, model.file_path);
  CHECK_FALSE(outcome.satisfied);
  CHECK(outcome.reason == "No class implementing 'OnModuleDestroy'");
}

TEST_CASE("evaluate_condition: negated fields fail when present", "[conditions]") {
  const auto model = make_model();
  registry::ConstraintCondition condition;
  condition.not_method_has_decorator = "Get";

  const auto outcome = constraints::evaluate_condition(condition, model, model.file_path);
  CHECK_FALSE(outcome.satisfied);
  CHECK(outcome.reason == "Found method/function decorator 'Get' (negated condition not satisfied)");
}

TEST_CASE("evaluate_condition: has_import matches globs and named imports", "[conditions]") {
  const auto model = make_model();
  registry::ConstraintCondition by_glob;
  by_glob.has_import = "@nestjs/*";
  CHECK(constraints::evaluate_condition(by_glob, model, model.file_path).satisfied);

  registry::ConstraintCondition by_name;
  by_name.has_import = "Controller";
  CHECK(constraints::evaluate_condition(by_name, model, model.file_path).satisfied);

  registry::ConstraintCondition missing;
  missing.has_import = "typeorm";
  CHECK_FALSE(constraints::evaluate_condition(missing, model, model.file_path).satisfied);
}

// ── unless ──────────────────────────────────────────────────────────────────

TEST_CASE("evaluate_unless: import, decorator and intent exceptions", "[conditions]") {
  const auto model = make_model();
  const auto context = make_context(model, {"public-api"});

  CHECK(constraints::evaluate_unless({"import:@nestjs/common"}, context).satisfied);
  CHECK(constraints::evaluate_unless({"@nestjs/common"}, context).satisfied);
  CHECK(constraints::evaluate_unless({"decorator:@Get"}, context).satisfied);
  CHECK(constraints::evaluate_unless({"@intent:public-api"}, context).satisfied);

  const auto none = constraints::evaluate_unless({"import:express", "@intent:internal"}, context);
  CHECK_FALSE(none.satisfied);
  CHECK(none.reason == "No unless exception applies");
}

// ── applies_when ────────────────────────────────────────────────────────────

TEST_CASE("evaluate_applies_when: match, no match and invalid pattern", "[conditions]") {
  const std::string content = "export class PaymentController {}\n";
  const auto hit = constraints::evaluate_applies_when("^export class", content);
  REQUIRE(hit.has_value());
  CHECK(hit.value());

  const auto miss = constraints::evaluate_applies_when("@Injectable", content);
  REQUIRE(miss.has_value());
  CHECK_FALSE(miss.value());

  CHECK_FALSE(constraints::evaluate_applies_when("([", content).has_value());
}

// ── intents ─────────────────────────────────────────────────────────────────

TEST_CASE("effective_intents_at: function intents shadow file intents inside the function",
          "[intents]") {
  semantic::SemanticModel model;
  model.content = "x";
  semantic::FunctionInfo admin;
  admin.name = "purge";
  admin.intents = {"admin-only"};
  admin.location = {10, 1};
  admin.end_line = 20;
  model.functions.push_back(admin);

  const auto context = make_context(model, {"public-api"});
  CHECK(constraints::effective_intents_at(context, 15) == std::vector<std::string>{"admin-only"});
  CHECK(constraints::effective_intents_at(context, 5) == std::vector<std::string>{"public-api"});
  CHECK(constraints::has_intent_anywhere(context, "ADMIN-ONLY"));
  CHECK(constraints::unless_intents({"@intent:a", "import:b", "@intent:"}) ==
        std::vector<std::string>{"a"});
}

TEST_CASE("function_scopes: annotation just above a function attaches to it", "[intents]") {
  semantic::SemanticModel model;
  semantic::FunctionInfo fn;
  fn.name = "export_report";
  fn.location = {12, 1};
  fn.end_line = 18;
  model.functions.push_back(fn);

  auto context = make_context(model);
  context.intent_annotations = {tags::IntentAnnotation{"cli-output", 11, false},
                                tags::IntentAnnotation{"far-away", 2, false}};
  const auto scopes = constraints::function_scopes(context);
  REQUIRE(scopes.size() == 1);
  CHECK(scopes[0].intents == std::vector<std::string>{"cli-output"});
}
