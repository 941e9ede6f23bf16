// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <string>
#include "mtexpr/expression.h"

namespace mtexpr {

// Canonical keyword of an operator in expression text, e.g. "greater than or equals".
const char* OperatorKeyword(Operator op);

/**
 * Canonical text of an expression. References print as `{element.attribute}`, operands
 * that are operations, compounds or nested groups are parenthesized, so the text parses
 * back to an expression that evaluates the same way.
 */
std::string ToString(const Expression& expr);

}  // namespace mtexpr
