// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/expression_printer.h"
#include <fmt/core.h>

namespace mtexpr {

const char* OperatorKeyword(Operator op) {
  switch (op) {
    case Operator::kAdd:
    case Operator::kIncrement:
      return "increment";
    case Operator::kSubtract:
    case Operator::kDecrement:
      return "decrement";
    case Operator::kMultiply:
      return "multiply";
    case Operator::kDivide:
      return "divide";
    case Operator::kEquals:
      return "equals";
    case Operator::kNotEquals:
      return "not equals";
    case Operator::kGreaterThan:
      return "greater than";
    case Operator::kLessThan:
      return "less than";
    case Operator::kGreaterEquals:
      return "greater than or equals";
    case Operator::kLessEquals:
      return "less than or equals";
    case Operator::kAnd:
      return "AND";
    case Operator::kOr:
      return "OR";
    case Operator::kNot:
      return "NOT";
    default:
      return "INVALID";
  }
}

static std::string OperandToString(const ExpressionPtr& operand) {
  if (!operand) {
    return "";
  }
  std::string s = ToString(*operand);
  if (operand->is_nested || operand->IsOperationOrCompound()) {
    return "(" + s + ")";
  }
  return s;
}

std::string ToString(const Expression& expr) {
  switch (expr.Type()) {
    case ExpressionType::kLiteral: {
      return ToString(expr.As<Literal>()->value);
    }
    case ExpressionType::kReference: {
      const ReferenceList& refs = expr.As<Reference>()->references;
      if (refs.empty()) {
        return "Invalid Reference";
      }
      std::string s;
      for (size_t i = 0; i < refs.size(); i++) {
        if (i > 0) {
          s.append(", ");
        }
        s.append(fmt::format("{{{}.{}}}", refs[i].element_name, refs[i].attribute_name));
      }
      return s;
    }
    case ExpressionType::kOperation: {
      const Operation* op = expr.As<Operation>();
      std::string left = OperandToString(op->left);
      // unary forms print with the implicit operand of 1
      if (op->op == Operator::kIncrement || op->op == Operator::kDecrement) {
        return fmt::format("{} {} 1", left, OperatorKeyword(op->op));
      }
      if (op->op == Operator::kNot) {
        return fmt::format("NOT {}", left);
      }
      return fmt::format("{} {} {}", left, OperatorKeyword(op->op), OperandToString(op->right));
    }
    case ExpressionType::kCompound: {
      const Compound* c = expr.As<Compound>();
      if (c->op == Operator::kNot) {
        return fmt::format("NOT {}", OperandToString(c->left ? c->left : c->right));
      }
      return fmt::format("{} {} {}", OperandToString(c->left), OperatorKeyword(c->op),
                         OperandToString(c->right));
    }
  }
  return "";
}

}  // namespace mtexpr
