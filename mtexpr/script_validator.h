// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <string>
#include <variant>
#include "mtexpr/model.h"
#include "mtexpr/script_sandbox.h"

namespace mtexpr {

struct Pass {};
struct Fail {
  std::string message;
};
typedef std::variant<Pass, Fail> ConstraintResult;

inline bool IsPass(const ConstraintResult& r) { return std::holds_alternative<Pass>(r); }

struct SyntaxCheck {
  bool valid = true;
  ValidationIssues issues;
};

// Rewrites engine syntax messages into the hints shown to constraint authors.
std::string FormatScriptError(const std::string& message);

/**
 * Runs constraint scripts against model elements. Every run builds a fresh sandbox in its own
 * script runtime, so one validator may be shared by concurrent callers.
 */
class ScriptValidator {
 public:
  explicit ScriptValidator(const ScriptLimits& limits = ScriptLimits(), bool trace_bindings = false)
      : limits_(limits), trace_bindings_(trace_bindings) {}

  // Compiles `code` without running it.
  SyntaxCheck ValidateSyntax(const std::string& code) const;
  // Never throws, compile, runtime and limit errors become a Fail.
  ConstraintResult Evaluate(const std::string& code, const ModelElement& element,
                            const Model& model, const Metamodel& metamodel) const;
  // Empty when the element satisfies the constraint.
  ValidationIssues EvaluateConstraint(const ScriptConstraint& constraint,
                                      const ModelElement& element, const Model& model,
                                      const Metamodel& metamodel) const;
  /**
   * Checks each element against the constraints of its metaclass, then the global ones.
   * Issues come back in element order whatever the number of threads.
   */
  ValidationIssues ValidateModel(const Model& model, const Metamodel& metamodel,
                                 int threads = 1) const;

 private:
  ValidationIssues ValidateElement(const ModelElement& element, const Model& model,
                                   const Metamodel& metamodel) const;

  ScriptLimits limits_;
  bool trace_bindings_;
};

}  // namespace mtexpr
