// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/expression.h"

namespace mtexpr {
static const char* kOperatorNames[] = {
    "ADD",       "SUBTRACT",     "MULTIPLY",       "DIVIDE",      "INCREMENT",
    "DECREMENT", "EQUALS",       "NOT_EQUALS",     "GREATER_THAN", "LESS_THAN",
    "GREATER_EQUALS", "LESS_EQUALS", "AND",        "OR",          "NOT",
};
static const char* kExpressionTypeNames[] = {"LITERAL", "REFERENCE", "OPERATION", "COMPOUND"};

const char* OperatorName(Operator op) {
  int idx = static_cast<int>(op);
  if (idx < 0 || idx >= static_cast<int>(Operator::kInvalid)) {
    return "INVALID";
  }
  return kOperatorNames[idx];
}

Operator OperatorFromName(std::string_view name) {
  for (int i = 0; i < static_cast<int>(Operator::kInvalid); i++) {
    if (name == kOperatorNames[i]) {
      return static_cast<Operator>(i);
    }
  }
  return Operator::kInvalid;
}

const char* ExpressionTypeName(ExpressionType type) {
  return kExpressionTypeNames[static_cast<int>(type)];
}

const ReferenceList& Expression::References() const {
  static const ReferenceList empty;
  if (auto ref = As<Reference>()) {
    return ref->references;
  }
  if (auto op = As<Operation>()) {
    return op->references;
  }
  return empty;
}

ExpressionPtr MakeLiteral(Value v) {
  auto expr = std::make_unique<Expression>();
  expr->node = Literal{std::move(v)};
  return expr;
}

ExpressionPtr MakeReference(ReferenceList refs) {
  auto expr = std::make_unique<Expression>();
  expr->node = Reference{std::move(refs)};
  return expr;
}

ExpressionPtr MakeReference(const std::string& element, const std::string& attribute) {
  ReferenceList refs;
  refs.push_back(ElementReference{element, attribute});
  return MakeReference(std::move(refs));
}

ExpressionPtr MakeOperation(Operator op, ExpressionPtr left, ExpressionPtr right) {
  ReferenceList refs;
  if (left) {
    const ReferenceList& l = left->References();
    refs.insert(refs.end(), l.begin(), l.end());
  }
  if (right) {
    const ReferenceList& r = right->References();
    refs.insert(refs.end(), r.begin(), r.end());
  }
  return MakeOperation(op, std::move(left), std::move(right), std::move(refs));
}

ExpressionPtr MakeOperation(Operator op, ExpressionPtr left, ExpressionPtr right,
                            ReferenceList refs) {
  Operation operation;
  operation.op = op;
  operation.left = std::move(left);
  operation.right = std::move(right);
  operation.references = std::move(refs);
  auto expr = std::make_unique<Expression>();
  expr->node = std::move(operation);
  return expr;
}

ExpressionPtr MakeCompound(Operator op, ExpressionPtr left, ExpressionPtr right) {
  Compound compound;
  compound.op = op;
  compound.left = std::move(left);
  compound.right = std::move(right);
  auto expr = std::make_unique<Expression>();
  expr->node = std::move(compound);
  return expr;
}

static ExpressionPtr CloneOperand(const ExpressionPtr& operand) {
  if (!operand) {
    return nullptr;
  }
  return Clone(*operand);
}

ExpressionPtr Clone(const Expression& expr) {
  ExpressionPtr copy;
  switch (expr.Type()) {
    case ExpressionType::kLiteral: {
      copy = MakeLiteral(expr.As<Literal>()->value);
      break;
    }
    case ExpressionType::kReference: {
      copy = MakeReference(expr.As<Reference>()->references);
      break;
    }
    case ExpressionType::kOperation: {
      const Operation* op = expr.As<Operation>();
      copy = MakeOperation(op->op, CloneOperand(op->left), CloneOperand(op->right),
                           op->references);
      break;
    }
    case ExpressionType::kCompound: {
      const Compound* c = expr.As<Compound>();
      copy = MakeCompound(c->op, CloneOperand(c->left), CloneOperand(c->right));
      break;
    }
  }
  copy->is_nested = expr.is_nested;
  return copy;
}

void CollectReferences(const Expression& expr, ReferenceList& refs) {
  switch (expr.Type()) {
    case ExpressionType::kLiteral: {
      return;
    }
    case ExpressionType::kReference: {
      const ReferenceList& list = expr.As<Reference>()->references;
      refs.insert(refs.end(), list.begin(), list.end());
      return;
    }
    case ExpressionType::kOperation: {
      const Operation* op = expr.As<Operation>();
      if (op->left) CollectReferences(*op->left, refs);
      if (op->right) CollectReferences(*op->right, refs);
      return;
    }
    case ExpressionType::kCompound: {
      const Compound* c = expr.As<Compound>();
      if (c->left) CollectReferences(*c->left, refs);
      if (c->right) CollectReferences(*c->right, refs);
      return;
    }
  }
}

}  // namespace mtexpr
