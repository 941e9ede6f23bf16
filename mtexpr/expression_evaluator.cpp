// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/expression_evaluator.h"
#include "mtexpr/expression_parser.h"
#include "mtexpr/mtexpr_log.h"

namespace mtexpr {

// `element.attribute` written as plain text in an operand slot
static bool LiteralAsReference(const Literal& literal, ElementReference& ref) {
  const std::string* s = std::get_if<std::string>(&literal.value);
  return s != nullptr && ParseElementReference(*s, ref);
}

ExpressionEvaluator::ExpressionEvaluator(const EvaluationContext& ctx, int max_depth)
    : ctx_(ctx), resolver_(ctx), max_depth_(max_depth) {}

Value ExpressionEvaluator::Evaluate(const Expression& expr) { return Evaluate(expr, 0); }

Value ExpressionEvaluator::Evaluate(const Expression& expr, int depth) {
  if (depth > max_depth_) {
    MTEXPR_WARN("Expression nesting exceeds max depth {}", max_depth_);
    return Null();
  }
  switch (expr.Type()) {
    case ExpressionType::kLiteral: {
      return expr.As<Literal>()->value;
    }
    case ExpressionType::kReference: {
      const ReferenceList& refs = expr.As<Reference>()->references;
      if (refs.empty()) {
        return Null();
      }
      // only the first reference of a multi-reference is evaluated
      return EvaluateReference(refs[0], depth);
    }
    case ExpressionType::kOperation: {
      return EvaluateOperation(*expr.As<Operation>(), depth);
    }
    case ExpressionType::kCompound: {
      return EvaluateCompound(*expr.As<Compound>(), depth);
    }
  }
  return Null();
}

Value ExpressionEvaluator::EvaluateReference(const ElementReference& ref, int depth) {
  std::optional<AttributeValue> resolved = resolver_.Resolve(ref.element_name, ref.attribute_name);
  if (!resolved) {
    MTEXPR_WARN("Could not resolve reference to {}.{}", ref.element_name, ref.attribute_name);
    return Null();
  }
  if (auto v = std::get_if<Value>(&(*resolved))) {
    return *v;
  }
  const auto& expr = std::get<std::shared_ptr<const Expression>>(*resolved);
  if (!expr) {
    return Null();
  }
  return Evaluate(*expr, depth + 1);
}

Value ExpressionEvaluator::EvaluateOperand(const ExpressionPtr& operand, int depth) {
  if (!operand) {
    return Null();
  }
  Value v;
  if (auto literal = operand->As<Literal>()) {
    ElementReference ref;
    if (LiteralAsReference(*literal, ref)) {
      v = EvaluateReference(ref, depth);
    } else {
      v = literal->value;
    }
  } else {
    v = Evaluate(*operand, depth + 1);
  }
  if (auto s = std::get_if<std::string>(&v)) {
    double d = 0;
    if (ParseNumber(*s, d)) {
      v = d;
    }
  }
  return v;
}

Value ExpressionEvaluator::EvaluateOperation(const Operation& op, int depth) {
  if (op.op == Operator::kInvalid) {
    MTEXPR_ERROR("Operation expression with invalid operator");
    return Null();
  }
  Value left = EvaluateOperand(op.left, depth);
  Value right = EvaluateOperand(op.right, depth);
  MTEXPR_DEBUG("Evaluating operation: {} {} {}", ToString(left), OperatorName(op.op),
               ToString(right));
  switch (op.op) {
    case Operator::kAdd:
      return Add(left, right);
    case Operator::kSubtract:
      return ToNumber(left) - ToNumber(right);
    case Operator::kMultiply:
      return ToNumber(left) * ToNumber(right);
    case Operator::kDivide:
      return ToNumber(left) / ToNumber(right);
    case Operator::kIncrement:
      return Add(left, Value(1.0));
    case Operator::kDecrement:
      return ToNumber(left) - 1;
    case Operator::kEquals:
      return LooseEquals(left, right);
    case Operator::kNotEquals:
      return !LooseEquals(left, right);
    case Operator::kGreaterThan:
      return Compare(left, right, RelationalOp::kGreater);
    case Operator::kLessThan:
      return Compare(left, right, RelationalOp::kLess);
    case Operator::kGreaterEquals:
      return Compare(left, right, RelationalOp::kGreaterEqual);
    case Operator::kLessEquals:
      return Compare(left, right, RelationalOp::kLessEqual);
    case Operator::kAnd:
      return IsTruthy(left) ? right : left;
    case Operator::kOr:
      return IsTruthy(left) ? left : right;
    case Operator::kNot:
      return !IsTruthy(left);
    default:
      MTEXPR_ERROR("Unsupported operator: {}", OperatorName(op.op));
      return Null();
  }
}

Value ExpressionEvaluator::EvaluateCompound(const Compound& c, int depth) {
  if (c.op != Operator::kAnd && c.op != Operator::kOr && c.op != Operator::kNot) {
    MTEXPR_ERROR("Unsupported compound operator: {}", OperatorName(c.op));
    return Null();
  }
  if (c.op == Operator::kNot) {
    const ExpressionPtr& operand = c.left ? c.left : c.right;
    if (!operand) {
      return Null();
    }
    return !IsTruthy(Evaluate(*operand, depth + 1));
  }
  if (!c.left) {
    if (!c.right) {
      return Null();
    }
    return Evaluate(*c.right, depth + 1);
  }
  Value left = Evaluate(*c.left, depth + 1);
  if (c.op == Operator::kAnd) {
    if (!IsTruthy(left)) {
      return false;
    }
  } else if (IsTruthy(left)) {
    return true;
  }
  if (!c.right) {
    return left;
  }
  return Evaluate(*c.right, depth + 1);
}

Value Evaluate(const Expression& expr, const EvaluationContext& ctx) {
  ExpressionEvaluator evaluator(ctx);
  return evaluator.Evaluate(expr);
}

Value EvaluateText(std::string_view text, const EvaluationContext& ctx) {
  ParseOptions options;
  options.available_elements = ctx.all_pattern_elements;
  ExpressionPtr expr = ParseExpression(text, options);
  if (!expr) {
    expr = MakeLiteral(Value(std::string(text)));
  }
  return Evaluate(*expr, ctx);
}

bool EvaluateGuard(const Expression& expr, const EvaluationContext& ctx) {
  Value v = Evaluate(expr, ctx);
  const bool* b = std::get_if<bool>(&v);
  return b == nullptr || *b;
}

std::optional<ElementReference> InferTarget(const Expression& expr) {
  const Operation* op = expr.As<Operation>();
  if (nullptr == op || !op->left) {
    return std::nullopt;
  }
  switch (op->op) {
    case Operator::kAdd:
    case Operator::kSubtract:
    case Operator::kMultiply:
    case Operator::kDivide:
    case Operator::kIncrement:
    case Operator::kDecrement:
      break;
    default:
      return std::nullopt;
  }
  const ReferenceList& refs = op->left->References();
  if (op->left->Type() == ExpressionType::kReference && !refs.empty()) {
    return refs[0];
  }
  if (auto literal = op->left->As<Literal>()) {
    ElementReference ref;
    if (LiteralAsReference(*literal, ref)) {
      return ref;
    }
  }
  return std::nullopt;
}

}  // namespace mtexpr
