// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace mtexpr {
struct Null {
  bool operator==(const Null&) const { return true; }
  bool operator!=(const Null&) const { return false; }
};

// Attribute values and evaluation results: null, boolean, number or string.
typedef std::variant<Null, bool, double, std::string> Value;
typedef std::map<std::string, Value> AttributeMap;

enum class RelationalOp { kLess, kLessEqual, kGreater, kGreaterEqual };

inline bool IsNull(const Value& v) { return std::holds_alternative<Null>(v); }
const char* TypeName(const Value& v);

bool IsTruthy(const Value& v);

/**
 * Number conversion of a string with the rules of JavaScript's Number(): surrounding
 * whitespace is ignored, an empty string is 0, `Infinity` and 0x/0o/0b prefixes are
 * accepted. Returns false when the text is not numeric.
 */
bool ParseNumber(std::string_view s, double& v);
bool IsNumericString(std::string_view s);
// Longest numeric prefix after leading whitespace, NaN when there is none (parseFloat).
double ParseFloatPrefix(std::string_view s);
double ToNumber(const Value& v);

std::string NumberToString(double d);
std::string ToString(const Value& v);

bool StrictEquals(const Value& a, const Value& b);
bool LooseEquals(const Value& a, const Value& b);
bool Compare(const Value& a, const Value& b, RelationalOp op);
// `+` with string concatenation when either side is a string.
Value Add(const Value& a, const Value& b);

}  // namespace mtexpr
