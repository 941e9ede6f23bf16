// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include <benchmark/benchmark.h>
#include <stdio.h>
#include "mtexpr/expression_evaluator.h"
#include "mtexpr/expression_parser.h"
#include "mtexpr/script_validator.h"
using namespace mtexpr;

static void BM_mtexpr_parse(benchmark::State& state) {
  std::string str = "(Place.tokens decrement {arc.weight}) multiply 2";
  for (auto _ : state) {
    ExpressionPtr expr = ParseExpression(str);
    benchmark::DoNotOptimize(expr);
  }
}

static void BM_mtexpr_eval(benchmark::State& state) {
  PatternElementMap pattern;
  pattern["p1"].id = "p1";
  pattern["p1"].name = "Place";
  pattern["p1"].attributes["tokens"] = Value(10.0);
  pattern["a1"].id = "a1";
  pattern["a1"].name = "arc";
  pattern["a1"].attributes["weight"] = Value(3.0);
  EvaluationContext ctx;
  ctx.pattern_elements = &pattern;
  ExpressionPtr expr = ParseExpression("(Place.tokens decrement {arc.weight}) multiply 2");
  if (!expr) {
    printf("Parse failed\n");
    return;
  }
  Value rv;
  for (auto _ : state) {
    rv = Evaluate(*expr, ctx);
  }
  printf("Eval result:%.2f\n", std::get<double>(rv));
}

static void BM_mtexpr_constraint(benchmark::State& state) {
  Metamodel metamodel;
  metamodel.id = "mm";
  metamodel.classes.resize(1);
  metamodel.classes[0].id = "c-product";
  metamodel.classes[0].name = "Product";
  Model model;
  model.id = "m";
  model.elements.resize(1);
  model.elements[0].id = "e1";
  model.elements[0].model_element_id = "c-product";
  model.elements[0].style["name"] = std::string("Widget");
  model.elements[0].style["price"] = 9.5;
  ScriptValidator validator;
  bool pass = false;
  for (auto _ : state) {
    pass = IsPass(validator.Evaluate("self.name.length > 0 && self.price < 10", model.elements[0],
                                     model, metamodel));
  }
  printf("Constraint result:%d\n", pass ? 1 : 0);
}

BENCHMARK(BM_mtexpr_parse);
BENCHMARK(BM_mtexpr_eval);
BENCHMARK(BM_mtexpr_constraint);
BENCHMARK_MAIN();
