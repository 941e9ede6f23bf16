// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <optional>
#include <string_view>
#include "mtexpr/expression.h"
#include "mtexpr/model.h"
#include "mtexpr/reference_resolver.h"

namespace mtexpr {

class ExpressionEvaluator {
 public:
  static constexpr int kDefaultMaxDepth = 32;

  explicit ExpressionEvaluator(const EvaluationContext& ctx, int max_depth = kDefaultMaxDepth);
  Value Evaluate(const Expression& expr);

 private:
  Value Evaluate(const Expression& expr, int depth);
  Value EvaluateReference(const ElementReference& ref, int depth);
  Value EvaluateOperand(const ExpressionPtr& operand, int depth);
  Value EvaluateOperation(const Operation& op, int depth);
  Value EvaluateCompound(const Compound& c, int depth);

  const EvaluationContext& ctx_;
  ReferenceResolver resolver_;
  int max_depth_;
};

Value Evaluate(const Expression& expr, const EvaluationContext& ctx);
// Parses `text` (a Literal when nothing else matches) and evaluates it.
Value EvaluateText(std::string_view text, const EvaluationContext& ctx);
// Guard semantics: only a boolean `false` result rejects.
bool EvaluateGuard(const Expression& expr, const EvaluationContext& ctx);
// The `element.attribute` an assignment-style Operation writes to.
std::optional<ElementReference> InferTarget(const Expression& expr);

}  // namespace mtexpr
