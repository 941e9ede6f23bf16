// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include <gtest/gtest.h>
#include "mtexpr/expression_parser.h"

using namespace mtexpr;

static const std::string& LiteralText(const ExpressionPtr& expr) {
  return std::get<std::string>(expr->As<Literal>()->value);
}

TEST(ExpressionParserTest, DirectReference) {
  ExpressionPtr expr = ParseExpression("Place.tokens");
  ASSERT_TRUE(expr != nullptr);
  ASSERT_EQ(ExpressionType::kReference, expr->Type());
  const ReferenceList& refs = expr->References();
  ASSERT_EQ(1, refs.size());
  EXPECT_EQ("Place", refs[0].element_name);
  EXPECT_EQ("tokens", refs[0].attribute_name);
}

TEST(ExpressionParserTest, DirectReferenceWithKeyword) {
  ExpressionPtr expr = ParseExpression("Place.tokens decrement {arc.weight}");
  ASSERT_TRUE(expr != nullptr);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kSubtract, op->op);
  ASSERT_EQ(ExpressionType::kReference, op->left->Type());
  ASSERT_EQ(ExpressionType::kReference, op->right->Type());
  EXPECT_EQ("arc", op->right->References()[0].element_name);
  ASSERT_EQ(2, op->references.size());
  EXPECT_EQ("Place", op->references[0].element_name);
  EXPECT_EQ("weight", op->references[1].attribute_name);
}

TEST(ExpressionParserTest, KeywordSynonymsAndCase) {
  ExpressionPtr add = ParseExpression("a.x add 2");
  ASSERT_TRUE(add != nullptr);
  EXPECT_EQ(Operator::kAdd, add->As<Operation>()->op);
  EXPECT_EQ("2", LiteralText(add->As<Operation>()->right));

  ExpressionPtr sub = ParseExpression("a.x subtract 2");
  ASSERT_TRUE(sub != nullptr);
  EXPECT_EQ(Operator::kSubtract, sub->As<Operation>()->op);

  ExpressionPtr mul = ParseExpression("a.x MULTIPLY 2");
  ASSERT_TRUE(mul != nullptr);
  EXPECT_EQ(Operator::kMultiply, mul->As<Operation>()->op);

  ExpressionPtr div = ParseExpression("a.x divide b.y");
  ASSERT_TRUE(div != nullptr);
  EXPECT_EQ(Operator::kDivide, div->As<Operation>()->op);
  EXPECT_EQ(ExpressionType::kReference, div->As<Operation>()->right->Type());
}

TEST(ExpressionParserTest, BracedReference) {
  ExpressionPtr expr = ParseExpression("{Place.tokens}");
  ASSERT_TRUE(expr != nullptr);
  ASSERT_EQ(ExpressionType::kReference, expr->Type());
  EXPECT_EQ("tokens", expr->References()[0].attribute_name);
}

TEST(ExpressionParserTest, BracedOperandsParseOperators) {
  ExpressionPtr expr = ParseExpression("{a.x} increment {b.y}");
  ASSERT_TRUE(expr != nullptr);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kAdd, op->op);
  EXPECT_EQ(2, op->references.size());

  ExpressionPtr logical = ParseExpression("{a.x} and {b.y}");
  ASSERT_TRUE(logical != nullptr);
  const Compound* c = logical->As<Compound>();
  ASSERT_TRUE(c != nullptr);
  EXPECT_EQ(Operator::kAnd, c->op);
}

TEST(ExpressionParserTest, LegacyBracedInference) {
  ExpressionPtr expr = ParseExpression("{a.x.y} increment {b.z}");
  ASSERT_TRUE(expr != nullptr);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kAdd, op->op);
  EXPECT_EQ("a", op->left->References()[0].element_name);
  EXPECT_EQ("x", op->left->References()[0].attribute_name);
  EXPECT_EQ(1.0, std::get<double>(op->right->As<Literal>()->value));
  EXPECT_EQ(2, op->references.size());

  ExpressionPtr multi = ParseExpression("{a.x.y} {b.z.w}");
  ASSERT_TRUE(multi != nullptr);
  ASSERT_EQ(ExpressionType::kReference, multi->Type());
  EXPECT_EQ(2, multi->References().size());

  ExpressionPtr scaled = ParseExpression("{a.x.y} multiply 3 {b.z.w}");
  ASSERT_TRUE(scaled != nullptr);
  EXPECT_EQ(Operator::kMultiply, scaled->As<Operation>()->op);
  EXPECT_EQ(3.0, std::get<double>(scaled->As<Operation>()->right->As<Literal>()->value));
}

TEST(ExpressionParserTest, InvalidBracedReference) {
  EXPECT_TRUE(ParseExpression("{tokens}") == nullptr);
}

TEST(ExpressionParserTest, Comparison) {
  ExpressionPtr expr = ParseExpression("Product.inStock greater than 5");
  ASSERT_TRUE(expr != nullptr);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kGreaterThan, op->op);
  EXPECT_EQ(ExpressionType::kReference, op->left->Type());
  EXPECT_EQ("5", LiteralText(op->right));

  EXPECT_EQ(Operator::kGreaterEquals,
            ParseExpression("a.b greater than or equals 3")->As<Operation>()->op);
  EXPECT_EQ(Operator::kLessEquals,
            ParseExpression("a.b less than or equals 3")->As<Operation>()->op);
  EXPECT_EQ(Operator::kLessThan, ParseExpression("a.b less than 3")->As<Operation>()->op);
  EXPECT_EQ(Operator::kEquals, ParseExpression("a.b equals 3")->As<Operation>()->op);
}

TEST(ExpressionParserTest, NotEqualsIsNotSplitAtEquals) {
  ExpressionPtr expr = ParseExpression("x not equals y");
  ASSERT_TRUE(expr != nullptr);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kNotEquals, op->op);
  EXPECT_EQ("x", LiteralText(op->left));
  EXPECT_EQ("y", LiteralText(op->right));
}

TEST(ExpressionParserTest, LogicalSplitsAtAndFirst) {
  ExpressionPtr expr = ParseExpression("a AND b OR c");
  ASSERT_TRUE(expr != nullptr);
  const Compound* c = expr->As<Compound>();
  ASSERT_TRUE(c != nullptr);
  EXPECT_EQ(Operator::kAnd, c->op);
  EXPECT_EQ("a", LiteralText(c->left));
  const Compound* right = c->right->As<Compound>();
  ASSERT_TRUE(right != nullptr);
  EXPECT_EQ(Operator::kOr, right->op);
}

TEST(ExpressionParserTest, FullyParenthesized) {
  ExpressionPtr expr = ParseExpression("(Place.tokens multiply 0.1)");
  ASSERT_TRUE(expr != nullptr);
  EXPECT_TRUE(expr->is_nested);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kMultiply, op->op);
  EXPECT_EQ("0.1", LiteralText(op->right));
}

TEST(ExpressionParserTest, NestedGroupOperand) {
  ExpressionPtr expr = ParseExpression("(a.x increment 1) multiply 2");
  ASSERT_TRUE(expr != nullptr);
  EXPECT_FALSE(expr->is_nested);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kMultiply, op->op);
  ASSERT_TRUE(op->left->is_nested);
  EXPECT_EQ(Operator::kAdd, op->left->As<Operation>()->op);
  EXPECT_EQ("2", LiteralText(op->right));
  ASSERT_EQ(1, op->references.size());
  EXPECT_EQ("x", op->references[0].attribute_name);
}

TEST(ExpressionParserTest, TwoNestedGroups) {
  ExpressionPtr expr = ParseExpression("(a.x equals 1) AND (b.y equals 2)");
  ASSERT_TRUE(expr != nullptr);
  const Compound* c = expr->As<Compound>();
  ASSERT_TRUE(c != nullptr);
  EXPECT_EQ(Operator::kAnd, c->op);
  ASSERT_TRUE(c->left->is_nested);
  ASSERT_TRUE(c->right->is_nested);
  EXPECT_EQ(Operator::kEquals, c->left->As<Operation>()->op);
  EXPECT_EQ("b", c->right->References()[0].element_name);
}

TEST(ExpressionParserTest, LiteralFallback) {
  ExpressionPtr expr = ParseExpression("hello world");
  ASSERT_TRUE(expr != nullptr);
  EXPECT_EQ("hello world", LiteralText(expr));

  ExpressionPtr flag = ParseExpression("true");
  ASSERT_TRUE(flag != nullptr);
  EXPECT_EQ(true, std::get<bool>(flag->As<Literal>()->value));

  ParseOptions options;
  options.allow_literal_fallback = false;
  EXPECT_TRUE(ParseExpression("hello world", options) == nullptr);
  // operands still fall back to literals
  EXPECT_TRUE(ParseExpression("a.x increment 1", options) != nullptr);
}

TEST(ExpressionParserTest, EmptyInput) {
  EXPECT_TRUE(ParseExpression("") == nullptr);
  EXPECT_TRUE(ParseExpression("   ") == nullptr);
}

TEST(ExpressionParserTest, UnknownElementIsAccepted) {
  std::vector<PatternElement> elements(1);
  elements[0].id = "p1";
  elements[0].name = "Place";
  ParseOptions options;
  options.available_elements = &elements;
  ExpressionPtr expr = ParseExpression("{Transition.fired}", options);
  ASSERT_TRUE(expr != nullptr);
  EXPECT_EQ("Transition", expr->References()[0].element_name);
}

TEST(ExpressionParserTest, Identifiers) {
  EXPECT_TRUE(IsIdentifier("_tokens2"));
  EXPECT_FALSE(IsIdentifier("2tokens"));
  EXPECT_FALSE(IsIdentifier("to-kens"));
  ElementReference ref;
  EXPECT_TRUE(ParseElementReference("Place.tokens", ref));
  EXPECT_EQ("Place", ref.element_name);
  EXPECT_FALSE(ParseElementReference("Place.tokens.count", ref));
  EXPECT_FALSE(ParseElementReference("Place", ref));
}

TEST(ExpressionParserTest, LongOperandParsesInLinearTime) {
  std::string text(60000, 'x');
  ExpressionPtr expr = ParseExpression(text + " equals 1");
  ASSERT_TRUE(expr != nullptr);
  const Operation* op = expr->As<Operation>();
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(Operator::kEquals, op->op);
  EXPECT_EQ(text, LiteralText(op->left));
  EXPECT_EQ("1", LiteralText(op->right));

  ExpressionPtr plain = ParseExpression(std::string(100000, 'y') + " and more text");
  ASSERT_TRUE(plain != nullptr);
  EXPECT_EQ(ExpressionType::kCompound, plain->Type());
}

TEST(ExpressionParserTest, LastKeywordSplitsFirst) {
  ExpressionPtr expr = ParseExpression("2 add b.y add 3");
  ASSERT_TRUE(expr != nullptr);
  const Operation* outer = expr->As<Operation>();
  ASSERT_TRUE(outer != nullptr);
  EXPECT_EQ("3", LiteralText(outer->right));
  ASSERT_TRUE(outer->left != nullptr);
  EXPECT_EQ(ExpressionType::kOperation, outer->left->Type());

  ExpressionPtr spaced = ParseExpression("2 not   equals 3");
  ASSERT_TRUE(spaced != nullptr);
  EXPECT_EQ(Operator::kNotEquals, spaced->As<Operation>()->op);
  // keywords need whitespace on both sides
  ExpressionPtr glued = ParseExpression("address book");
  ASSERT_TRUE(glued != nullptr);
  EXPECT_EQ("address book", LiteralText(glued));
}

TEST(ExpressionParserTest, DeepNestingIsBounded) {
  std::string text = "1";
  for (int i = 0; i < 500; i++) {
    text += " add 1";
  }
  ParseOptions options;
  options.max_depth = 16;
  ExpressionPtr expr = ParseExpression(text, options);
  ASSERT_TRUE(expr != nullptr);
  EXPECT_EQ(ExpressionType::kOperation, expr->Type());
}
