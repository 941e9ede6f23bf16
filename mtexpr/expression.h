// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "mtexpr/value.h"

namespace mtexpr {

enum class Operator {
  kAdd = 0,
  kSubtract,
  kMultiply,
  kDivide,
  kIncrement,
  kDecrement,
  kEquals,
  kNotEquals,
  kGreaterThan,
  kLessThan,
  kGreaterEquals,
  kLessEquals,
  kAnd,
  kOr,
  kNot,
  kInvalid,
};
// Persisted names: ADD, SUBTRACT, ... NOT; kInvalid has no name of its own.
const char* OperatorName(Operator op);
Operator OperatorFromName(std::string_view name);

enum class ExpressionType { kLiteral = 0, kReference, kOperation, kCompound };
const char* ExpressionTypeName(ExpressionType type);

struct ElementReference {
  std::string element_name;
  std::string attribute_name;
  bool operator==(const ElementReference& other) const {
    return element_name == other.element_name && attribute_name == other.attribute_name;
  }
};
typedef std::vector<ElementReference> ReferenceList;

struct Expression;
typedef std::unique_ptr<Expression> ExpressionPtr;

struct Literal {
  Value value;
};

struct Reference {
  ReferenceList references;
};

struct Operation {
  Operator op = Operator::kInvalid;
  ExpressionPtr left;
  ExpressionPtr right;
  // union of the operands' reference lists
  ReferenceList references;
};

// AND/OR/NOT with short-circuit evaluation.
struct Compound {
  Operator op = Operator::kAnd;
  ExpressionPtr left;
  ExpressionPtr right;
};

struct Expression {
  std::variant<Literal, Reference, Operation, Compound> node;
  // set on whatever a parenthesized group produced, no effect on evaluation
  bool is_nested = false;

  ExpressionType Type() const { return static_cast<ExpressionType>(node.index()); }
  template <typename T>
  const T* As() const {
    return std::get_if<T>(&node);
  }
  template <typename T>
  T* As() {
    return std::get_if<T>(&node);
  }
  bool IsOperationOrCompound() const {
    return Type() == ExpressionType::kOperation || Type() == ExpressionType::kCompound;
  }
  // The reference list of a Reference or Operation node, empty for the others.
  const ReferenceList& References() const;
};

ExpressionPtr MakeLiteral(Value v);
ExpressionPtr MakeReference(ReferenceList refs);
ExpressionPtr MakeReference(const std::string& element, const std::string& attribute);
// Aggregates the operands' references into the new node.
ExpressionPtr MakeOperation(Operator op, ExpressionPtr left, ExpressionPtr right);
ExpressionPtr MakeOperation(Operator op, ExpressionPtr left, ExpressionPtr right,
                            ReferenceList refs);
ExpressionPtr MakeCompound(Operator op, ExpressionPtr left, ExpressionPtr right);
ExpressionPtr Clone(const Expression& expr);

// Every reference that appears in the tree, in depth-first order.
void CollectReferences(const Expression& expr, ReferenceList& refs);

}  // namespace mtexpr
