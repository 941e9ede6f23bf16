// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "mtexpr/expression.h"
#include "mtexpr/model.h"

namespace mtexpr {

struct ParseOptions {
  // Pattern elements visible to the rule; unknown element names are only logged.
  const std::vector<PatternElement>* available_elements = nullptr;
  // When false, text matching no rule yields nullptr instead of a Literal.
  bool allow_literal_fallback = true;
  // Deeper keyword or group nesting is kept as literal text.
  int max_depth = 64;
};

/**
 * Parser of the rule expression language.
 *
 * Recognition order, first match wins:
 *   1. `element.attribute`, optionally followed by an arithmetic keyword and an operand
 *   2. braced references `{element.attribute}`
 *   3. parenthesized groups, innermost first
 *   4. `<a> increment|add|decrement|subtract|multiply|divide <b>`
 *   5. `<a> equals|not equals|greater than|less than|... <b>`
 *   6. `<a> AND|OR <b>`
 *   7. the raw text as a Literal
 *
 * Parse never throws, a nullptr result means the input is empty or malformed. Every rule
 * scans the text linearly.
 */
class ExpressionParser {
 public:
  explicit ExpressionParser(const ParseOptions& options = ParseOptions());
  ExpressionPtr Parse(std::string_view input);

 private:
  ExpressionPtr ParseText(std::string_view input, bool top_level);
  bool ParseDirectReference(const std::string& input, ExpressionPtr& result);
  ExpressionPtr ParseBracedReferences(const std::string& input);
  ExpressionPtr ParseNested(const std::string& input, bool top_level);
  ExpressionPtr ParseArithmetic(const std::string& input);
  ExpressionPtr ParseComparison(const std::string& input);
  ExpressionPtr ParseLogical(const std::string& input);
  void CheckAvailable(const ElementReference& ref);

  struct DepthGuard {
    explicit DepthGuard(int& depth) : depth_(depth) { depth_++; }
    ~DepthGuard() { depth_--; }
    int& depth_;
  };

  ParseOptions options_;
  int nested_seq_ = 0;
  int depth_ = 0;
};

ExpressionPtr ParseExpression(std::string_view input, const ParseOptions& options = ParseOptions());

// Full match of `identifier.identifier`.
bool ParseElementReference(std::string_view text, ElementReference& ref);
// Full match of `[A-Za-z_][A-Za-z0-9_]*`.
bool IsIdentifier(std::string_view text);

}  // namespace mtexpr
