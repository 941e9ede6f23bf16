// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include <gtest/gtest.h>
#include "mtexpr/mtexpr_err.h"
#include "mtexpr/script_sandbox.h"
#include "mtexpr/script_validator.h"

using namespace mtexpr;

namespace {
struct Catalog {
  Metamodel metamodel;
  Model model;

  Catalog() {
    metamodel.id = "mm";
    metamodel.name = "Catalog";
    metamodel.classes.resize(1);
    metamodel.classes[0].id = "c-item";
    metamodel.classes[0].name = "Item";
    model.id = "m";
    model.name = "Items";
    model.elements.resize(1);
    model.elements[0].id = "i1";
    model.elements[0].model_element_id = "c-item";
    model.elements[0].style["name"] = std::string("Lamp");
  }
};

ConstraintResult Run(const std::string& code, const ScriptLimits& limits = ScriptLimits()) {
  Catalog catalog;
  ScriptValidator validator(limits);
  return validator.Evaluate(code, catalog.model.elements[0], catalog.model, catalog.metamodel);
}

std::string FailMessage(const ConstraintResult& result) {
  const Fail* fail = std::get_if<Fail>(&result);
  return fail == nullptr ? "" : fail->message;
}
}  // namespace

TEST(ScriptSandboxTest, OnlyWhitelistedGlobals) {
  EXPECT_TRUE(IsPass(Run("typeof Math.max === 'function' && typeof JSON.parse === 'function'")));
  EXPECT_TRUE(IsPass(Run("typeof eval === 'undefined' && typeof Function === 'undefined'")));
  EXPECT_TRUE(IsPass(Run("typeof Proxy === 'undefined' && typeof Promise === 'undefined'")));
  EXPECT_TRUE(IsPass(Run("typeof globalThis === 'undefined' && typeof Symbol === 'undefined'")));
  EXPECT_TRUE(IsPass(Run("typeof require === 'undefined' && typeof std === 'undefined'")));
  EXPECT_TRUE(IsPass(Run("encodeURIComponent('a b') === 'a%20b' && parseInt('42px') === 42")));
  EXPECT_TRUE(IsPass(Run("new Date(0).getTime() === 0 && isNaN(parseFloat('x'))")));
  EXPECT_TRUE(IsPass(Run("JSON.stringify(JSON.parse('{\"a\": [1, 2]}')) === '{\"a\":[1,2]}'")));
  EXPECT_TRUE(IsPass(Run("console.log('checking', self.name); return true;")));
}

TEST(ScriptSandboxTest, CollectionOperations) {
  EXPECT_TRUE(IsPass(Run("[1, 2, 3].size === 3 && [].isEmpty && [0].notEmpty")));
  EXPECT_TRUE(IsPass(Run("[1, 2, 3].select(x => x > 1).collect(x => x * 2).sum() === 10")));
  EXPECT_TRUE(IsPass(Run("[1, 2].includesAll([2]) && [1, 2].excludesAll([3]) && [1].excludes(2)")));
  EXPECT_TRUE(IsPass(Run("[1, 2, 3].count(x => x % 2 === 1) === 2 && [1, 2, 3].one(x => x === 2)")));
  EXPECT_TRUE(IsPass(Run("[1, NaN, 1].count(1) === 2 && [NaN].count(NaN) === 1")));
  EXPECT_TRUE(IsPass(Run("return [1, 2, 3].exists(x => x === 3) && [1, 2].forAll(x => x > 0);")));
  EXPECT_EQ("Constraint failed", FailMessage(Run("return [1, 2].forAll(x => x > 1);")));
  EXPECT_TRUE(IsPass(Run("[1, 2, 3].reject(x => x > 1).length === 1 && [4, 5].any(x => x > 4) === 5")));
  // not enumerable
  EXPECT_TRUE(IsPass(Run("Object.keys([7]).length === 1")));
}

TEST(ScriptSandboxTest, TimeLimit) {
  ScriptLimits limits;
  limits.timeout_ms = 50;
  EXPECT_EQ("Runtime error: Script exceeded the time limit of 50 ms",
            FailMessage(Run("return (function () { while (true) {} })();", limits)));
  // the interruption can not be caught by the script
  EXPECT_EQ("Runtime error: Script exceeded the time limit of 50 ms",
            FailMessage(Run("try { for (;;) {} } catch (e) {}\nreturn true;", limits)));
}

TEST(ScriptSandboxTest, StackAndMemoryLimits) {
  std::string overflow = FailMessage(Run("function f(n) { return 1 + f(n + 1); }\nreturn f(0);"));
  EXPECT_EQ(0, overflow.find("Runtime error: "));
  EXPECT_NE(std::string::npos, overflow.find("stack overflow"));

  ScriptLimits limits;
  limits.memory_limit = 8 * 1024 * 1024;
  ConstraintResult result =
      Run("var a = [];\nfor (;;) { a.push('entry number ' + a.length); }", limits);
  EXPECT_FALSE(IsPass(result));
  EXPECT_EQ(0, FailMessage(result).find("Runtime error: "));
}

TEST(ScriptSandboxTest, BacktrackingRegexStaysBounded) {
  ScriptLimits limits;
  limits.timeout_ms = 200;
  ConstraintResult result = Run(
      "var s = '';\nfor (var i = 0; i < 20000; i++) { s += 'a'; }\nreturn /(a|b)*c/.test(s);",
      limits);
  EXPECT_FALSE(IsPass(result));
  EXPECT_TRUE(IsPass(Run("return /^[a-z]+\\d$/.test('abc1') && 'a-b-c'.replace(/-/g, '') === 'abc';")));
}

TEST(ScriptSandboxTest, CompileAndCall) {
  ScriptContext sandbox;
  std::string error;
  ASSERT_EQ(MTEXPR_OK, sandbox.Init(error)) << error;
  JSContext* ctx = sandbox.Context();
  sandbox.Bind("a", JS_NewFloat64(ctx, 2));
  sandbox.Bind("b", JS_NewFloat64(ctx, 3));
  // rebinding keeps the parameter position
  sandbox.Bind("a", JS_NewFloat64(ctx, 4));
  EXPECT_EQ((std::vector<std::string>{"a", "b"}), sandbox.Names());

  JSValue fn;
  ASSERT_EQ(MTEXPR_OK, sandbox.Compile("return a * b;", false, fn, error)) << error;
  ScopedJSValue product_fn(ctx, fn);
  JSValue result;
  ASSERT_EQ(MTEXPR_OK, sandbox.Call(product_fn.Get(), result, error)) << error;
  ScopedJSValue product(ctx, result);
  EXPECT_EQ("12", ScriptToString(ctx, product.Get()));

  EXPECT_EQ(MTEXPR_ERR_UNEXPECTED_EOF, sandbox.Compile("return (a", true, fn, error));
  EXPECT_EQ("Unexpected end of input", error);
  EXPECT_EQ(MTEXPR_ERR_SYNTAX, sandbox.Compile("return a +* b;", true, fn, error));
  EXPECT_EQ(MTEXPR_ERR_SYNTAX, sandbox.Compile("return 1;\nreturn a +* b;", true, fn, error));

  // only bound names are visible
  ASSERT_EQ(MTEXPR_OK, sandbox.Compile("return c;", false, fn, error)) << error;
  ScopedJSValue missing_fn(ctx, fn);
  EXPECT_EQ(MTEXPR_ERR_RUNTIME, sandbox.Call(missing_fn.Get(), result, error));
  EXPECT_NE(std::string::npos, error.find("not defined"));
}

TEST(ScriptSandboxTest, CompileBeforeInit) {
  ScriptContext sandbox;
  JSValue fn;
  std::string error;
  EXPECT_EQ(MTEXPR_ERR_ENGINE_INIT, sandbox.Compile("return true;", true, fn, error));
}
