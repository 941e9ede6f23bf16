// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/script_validator.h"
#include <boost/algorithm/string.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <vector>
#include "mtexpr/mtexpr_err.h"
#include "mtexpr/mtexpr_log.h"
#include "mtexpr/script_sandbox.h"

namespace mtexpr {

static const char* kSyntaxCheckId = "syntax-check";

std::string FormatScriptError(const std::string& message) {
  if (boost::algorithm::icontains(message, "unexpected token")) {
    return "Syntax error: " + message;
  }
  if (boost::algorithm::icontains(message, "unexpected end of")) {
    return "Syntax error: Unexpected end of expression. Check for missing closing brackets, "
           "parentheses, or quotes.";
  }
  return message;
}

// code without return/if/for is a single expression
static bool IsSimpleExpression(const std::string& code) {
  return code.find("return") == std::string::npos && code.find("if") == std::string::npos &&
         code.find("for") == std::string::npos;
}

static std::string WrapExpression(const std::string& code) { return "return (" + code + "\n);"; }

static ConstraintResult ToConstraintResult(JSContext* ctx, JSValueConst result) {
  if (JS_IsUndefined(result)) {
    return Pass{};
  }
  if (JS_IsBool(result)) {
    if (JS_ToBool(ctx, result) > 0) {
      return Pass{};
    }
    return Fail{"Constraint failed"};
  }
  if (JS_IsObject(result) && !JS_IsFunction(ctx, result)) {
    JSAtom valid_atom = JS_NewAtom(ctx, "valid");
    int has_valid = JS_HasProperty(ctx, result, valid_atom);
    JS_FreeAtom(ctx, valid_atom);
    if (has_valid > 0) {
      ScopedJSValue valid(ctx, JS_GetPropertyStr(ctx, result, "valid"));
      if (JS_IsBool(valid.Get()) && JS_ToBool(ctx, valid.Get()) > 0) {
        return Pass{};
      }
      ScopedJSValue message(ctx, JS_GetPropertyStr(ctx, result, "message"));
      if (JS_ToBool(ctx, message.Get()) > 0) {
        return Fail{ScriptToString(ctx, message.Get())};
      }
      return Fail{"Constraint failed"};
    }
  }
  return Fail{"Constraint returned an invalid result: " + ScriptToString(ctx, result)};
}

SyntaxCheck ScriptValidator::ValidateSyntax(const std::string& code) const {
  SyntaxCheck check;
  ScriptContext sandbox(limits_);
  std::string error;
  if (MTEXPR_OK == sandbox.Init(error)) {
    sandbox.Bind("self", JS_NewObject(sandbox.Context()));
    JSValue unused;
    if (MTEXPR_OK == sandbox.Compile(code, true, unused, error)) {
      return check;
    }
    std::string expression_error;
    if (MTEXPR_OK == sandbox.Compile(WrapExpression(code), true, unused, expression_error)) {
      return check;
    }
  }
  MTEXPR_DEBUG("Constraint script rejected: {}", error);
  check.valid = false;
  ValidationIssue issue;
  issue.severity = Severity::kError;
  issue.message = FormatScriptError(error);
  issue.constraint_id = kSyntaxCheckId;
  issue.expression = code;
  check.issues.push_back(std::move(issue));
  return check;
}

ConstraintResult ScriptValidator::Evaluate(const std::string& code, const ModelElement& element,
                                           const Model& model, const Metamodel& metamodel) const {
  ScriptContext sandbox(limits_);
  std::string error;
  if (MTEXPR_OK != sandbox.Init(error)) {
    MTEXPR_ERROR("Failed to start the script engine: {}", error);
    return Fail{"Runtime error: " + error};
  }
  BuildSandbox(element, model, metamodel, sandbox, trace_bindings_);
  JSContext* ctx = sandbox.Context();

  std::string body = IsSimpleExpression(code) ? WrapExpression(code) : code + "\nreturn true;";
  JSValue fn;
  int rc = sandbox.Compile(body, false, fn, error);
  if (MTEXPR_OK != rc) {
    return Fail{"Runtime error: " + error};
  }
  ScopedJSValue compiled(ctx, fn);
  JSValue result;
  rc = sandbox.Call(compiled.Get(), result, error);
  if (MTEXPR_OK != rc) {
    MTEXPR_DEBUG("Constraint script on element {} failed with code {}: {}", element.id, rc, error);
    return Fail{"Runtime error: " + error};
  }
  ScopedJSValue returned(ctx, result);
  return ToConstraintResult(ctx, returned.Get());
}

ValidationIssues ScriptValidator::EvaluateConstraint(const ScriptConstraint& constraint,
                                                     const ModelElement& element,
                                                     const Model& model,
                                                     const Metamodel& metamodel) const {
  ValidationIssues issues;
  ValidationIssue issue;
  issue.severity = constraint.severity;
  issue.element_id = element.id;
  issue.constraint_id = constraint.id;
  issue.expression = constraint.expression;
  if (!constraint.is_valid) {
    issue.message = constraint.error_message.value_or("Invalid constraint syntax");
    issues.push_back(std::move(issue));
    return issues;
  }
  try {
    ConstraintResult result = Evaluate(constraint.expression, element, model, metamodel);
    if (IsPass(result)) {
      return issues;
    }
    issue.message = std::get<Fail>(result).message;
  } catch (const std::exception& e) {
    MTEXPR_ERROR("Error evaluating constraint '{}' on element {}: {}", constraint.name,
                 element.id, e.what());
    issue.message = fmt::format("Error evaluating constraint \"{}\": {}", constraint.name, e.what());
  }
  issues.push_back(std::move(issue));
  return issues;
}

ValidationIssues ScriptValidator::ValidateElement(const ModelElement& element, const Model& model,
                                                  const Metamodel& metamodel) const {
  ValidationIssues issues;
  auto check = [&](const ConstraintList& constraints) {
    for (const auto& constraint : constraints) {
      ValidationIssues found = EvaluateConstraint(constraint, element, model, metamodel);
      issues.insert(issues.end(), found.begin(), found.end());
    }
  };
  const MetaClass* cls = metamodel.FindClass(element.model_element_id);
  if (cls != nullptr) {
    check(cls->constraints);
  }
  check(metamodel.constraints);
  return issues;
}

ValidationIssues ScriptValidator::ValidateModel(const Model& model, const Metamodel& metamodel,
                                                int threads) const {
  std::vector<ValidationIssues> per_element(model.elements.size());
  if (threads <= 1 || model.elements.size() <= 1) {
    for (size_t i = 0; i < model.elements.size(); i++) {
      per_element[i] = ValidateElement(model.elements[i], model, metamodel);
    }
  } else {
    boost::asio::thread_pool pool(static_cast<size_t>(threads));
    for (size_t i = 0; i < model.elements.size(); i++) {
      boost::asio::post(pool, [this, i, &model, &metamodel, &per_element]() {
        per_element[i] = ValidateElement(model.elements[i], model, metamodel);
      });
    }
    pool.join();
  }
  ValidationIssues issues;
  for (auto& element_issues : per_element) {
    issues.insert(issues.end(), element_issues.begin(), element_issues.end());
  }
  MTEXPR_DEBUG("Validated {} elements of model {}: {} issues", model.elements.size(), model.id,
               issues.size());
  return issues;
}

}  // namespace mtexpr
