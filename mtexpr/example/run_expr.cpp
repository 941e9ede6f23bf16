// Copyright (c) 2021, Tencent Inc.
// All rights reserved.

#include <fmt/core.h>
#include <gflags/gflags.h>
#include <string>

#include "mtexpr/constraint_json.h"
#include "mtexpr/expression_evaluator.h"
#include "mtexpr/expression_json.h"
#include "mtexpr/expression_parser.h"
#include "mtexpr/expression_printer.h"
#include "mtexpr/mtexpr_options.h"
#include "mtexpr/script_validator.h"

DEFINE_string(options, "", "engine options json file");
DEFINE_string(expr, "Place.tokens decrement {arc.weight}", "rule expression");
DEFINE_string(constraint, "self.name.length > 0", "constraint script");
DEFINE_double(tokens, 10, "tokens of the Place pattern element");
DEFINE_double(weight, 3, "weight of the arc pattern element");
DEFINE_string(name, "Widget", "name of the checked model element");

using namespace mtexpr;

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, false);
  EngineOptions options;
  if (!FLAGS_options.empty()) {
    int rc = LoadOptionsFromFile(FLAGS_options, options);
    if (0 != rc) {
      fmt::print("Invalid options file {}: {}\n", FLAGS_options, rc);
      return rc;
    }
  }
  ApplyLogLevel(options.log_level);

  PatternElementMap pattern;
  pattern["p1"].id = "p1";
  pattern["p1"].name = "Place";
  pattern["p1"].type = "Place";
  pattern["p1"].attributes["tokens"] = Value(FLAGS_tokens);
  pattern["a1"].id = "a1";
  pattern["a1"].name = "arc";
  pattern["a1"].type = "Arc";
  pattern["a1"].attributes["weight"] = Value(FLAGS_weight);
  EvaluationContext ctx;
  ctx.pattern_elements = &pattern;

  ExpressionPtr expr = ParseExpression(FLAGS_expr);
  if (!expr) {
    fmt::print("Failed to parse '{}'\n", FLAGS_expr);
    return -1;
  }
  ExpressionEvaluator evaluator(ctx, options.max_expression_depth);
  fmt::print("canonical: {}\n", ToString(*expr));
  fmt::print("json: {}\n", ExpressionToJson(*expr));
  fmt::print("value: {}\n", ToString(evaluator.Evaluate(*expr)));

  Metamodel metamodel;
  metamodel.id = "mm";
  metamodel.name = "Demo";
  metamodel.classes.resize(1);
  metamodel.classes[0].id = "c-product";
  metamodel.classes[0].name = "Product";
  Model model;
  model.id = "m";
  model.name = "DemoModel";
  model.elements.resize(1);
  model.elements[0].id = "e1";
  model.elements[0].model_element_id = "c-product";
  model.elements[0].style["name"] = FLAGS_name;

  ScriptValidator validator(options.Limits(), options.trace_sandbox_bindings);
  SyntaxCheck check = validator.ValidateSyntax(FLAGS_constraint);
  if (!check.valid) {
    fmt::print("syntax: {}\n", IssuesToJson(check.issues));
    return 0;
  }
  ConstraintResult result =
      validator.Evaluate(FLAGS_constraint, model.elements[0], model, metamodel);
  if (IsPass(result)) {
    fmt::print("constraint: pass\n");
  } else {
    fmt::print("constraint: fail ({})\n", std::get<Fail>(result).message);
  }
  return 0;
}
