// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/value.h"
#include <fmt/core.h>
#include <boost/spirit/home/x3.hpp>
#include <cmath>
#include <limits>

namespace mtexpr {
namespace parser {
namespace x3 = boost::spirit::x3;

// Decimal literals only, `nan` and `inf` spellings are not numbers here.
template <typename T>
struct decimal_policies : x3::real_policies<T> {
  template <typename Iterator, typename Attribute>
  static bool parse_nan(Iterator&, Iterator const&, Attribute&) {
    return false;
  }
  template <typename Iterator, typename Attribute>
  static bool parse_inf(Iterator&, Iterator const&, Attribute&) {
    return false;
  }
};
x3::real_parser<double, decimal_policies<double> > const decimal_ = {};
x3::uint_parser<uint64_t, 16> const hex_ = {};
x3::uint_parser<uint64_t, 8> const oct_ = {};
x3::uint_parser<uint64_t, 2> const bin_ = {};
}  // namespace parser

static bool IsJsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

const char* TypeName(const Value& v) {
  switch (v.index()) {
    case 0:
      return "null";
    case 1:
      return "boolean";
    case 2:
      return "number";
    default:
      return "string";
  }
}

bool IsTruthy(const Value& v) {
  switch (v.index()) {
    case 0:
      return false;
    case 1:
      return std::get<bool>(v);
    case 2: {
      double d = std::get<double>(v);
      return !(d == 0 || std::isnan(d));
    }
    default:
      return !std::get<std::string>(v).empty();
  }
}

bool ParseNumber(std::string_view s, double& v) {
  namespace x3 = boost::spirit::x3;
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && IsJsSpace(s[begin])) begin++;
  while (end > begin && IsJsSpace(s[end - 1])) end--;
  std::string_view text = s.substr(begin, end - begin);
  if (text.empty()) {
    v = 0;
    return true;
  }
  if (text == "Infinity" || text == "+Infinity") {
    v = std::numeric_limits<double>::infinity();
    return true;
  }
  if (text == "-Infinity") {
    v = -std::numeric_limits<double>::infinity();
    return true;
  }
  auto first = text.begin();
  auto last = text.end();
  if (text.size() > 2 && text[0] == '0') {
    uint64_t n = 0;
    bool prefixed = true;
    bool ok = false;
    auto digits = first + 2;
    switch (text[1]) {
      case 'x':
      case 'X':
        ok = x3::parse(digits, last, parser::hex_, n);
        break;
      case 'o':
      case 'O':
        ok = x3::parse(digits, last, parser::oct_, n);
        break;
      case 'b':
      case 'B':
        ok = x3::parse(digits, last, parser::bin_, n);
        break;
      default:
        prefixed = false;
        break;
    }
    if (prefixed) {
      if (!ok || digits != last) {
        return false;
      }
      v = static_cast<double>(n);
      return true;
    }
  }
  double d = 0;
  if (!x3::parse(first, last, parser::decimal_, d) || first != last) {
    return false;
  }
  v = d;
  return true;
}

bool IsNumericString(std::string_view s) {
  double d;
  return ParseNumber(s, d);
}

double ParseFloatPrefix(std::string_view s) {
  namespace x3 = boost::spirit::x3;
  size_t begin = 0;
  while (begin < s.size() && IsJsSpace(s[begin])) begin++;
  std::string_view text = s.substr(begin);
  bool negative = false;
  std::string_view unsigned_text = text;
  if (!unsigned_text.empty() && (unsigned_text[0] == '+' || unsigned_text[0] == '-')) {
    negative = unsigned_text[0] == '-';
    unsigned_text.remove_prefix(1);
  }
  if (unsigned_text.substr(0, 8) == "Infinity") {
    return negative ? -std::numeric_limits<double>::infinity()
                    : std::numeric_limits<double>::infinity();
  }
  auto first = text.begin();
  double d = 0;
  if (!x3::parse(first, text.end(), parser::decimal_, d)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return d;
}

double ToNumber(const Value& v) {
  switch (v.index()) {
    case 0:
      return 0;
    case 1:
      return std::get<bool>(v) ? 1 : 0;
    case 2:
      return std::get<double>(v);
    default: {
      double d = 0;
      if (ParseNumber(std::get<std::string>(v), d)) {
        return d;
      }
      return std::numeric_limits<double>::quiet_NaN();
    }
  }
}

std::string NumberToString(double d) {
  if (std::isnan(d)) {
    return "NaN";
  }
  if (std::isinf(d)) {
    return d > 0 ? "Infinity" : "-Infinity";
  }
  if (d == 0) {
    return "0";
  }
  if (std::trunc(d) == d && std::fabs(d) < 1e21) {
    return fmt::format("{:.0f}", d);
  }
  std::string s = fmt::format("{}", d);
  // fmt writes exponents as e-07, script output uses e-7
  size_t e = s.find('e');
  if (e != std::string::npos) {
    std::string mantissa = s.substr(0, e);
    char sign = '+';
    size_t pos = e + 1;
    if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) {
      sign = s[pos];
      pos++;
    }
    while (pos + 1 < s.size() && s[pos] == '0') pos++;
    std::string exponent = s.substr(pos);
    if (sign == '-' && (exponent == "5" || exponent == "6")) {
      // 1e-5 and 1e-6 still print in fixed notation
      std::string prefix = d < 0 ? "-" : "";
      std::string digits;
      for (char c : mantissa) {
        if (c >= '0' && c <= '9') digits.push_back(c);
      }
      return prefix + "0." + std::string(exponent == "5" ? 4 : 5, '0') + digits;
    }
    s = mantissa + "e" + sign + exponent;
  }
  return s;
}

std::string ToString(const Value& v) {
  switch (v.index()) {
    case 0:
      return "null";
    case 1:
      return std::get<bool>(v) ? "true" : "false";
    case 2:
      return NumberToString(std::get<double>(v));
    default:
      return std::get<std::string>(v);
  }
}

bool StrictEquals(const Value& a, const Value& b) {
  if (a.index() != b.index()) {
    return false;
  }
  switch (a.index()) {
    case 0:
      return true;
    case 1:
      return std::get<bool>(a) == std::get<bool>(b);
    case 2:
      return std::get<double>(a) == std::get<double>(b);
    default:
      return std::get<std::string>(a) == std::get<std::string>(b);
  }
}

bool LooseEquals(const Value& a, const Value& b) {
  if (a.index() == b.index()) {
    return StrictEquals(a, b);
  }
  if (IsNull(a) || IsNull(b)) {
    return false;
  }
  // remaining mixes of boolean, number and string all compare numerically
  return ToNumber(a) == ToNumber(b);
}

bool Compare(const Value& a, const Value& b, RelationalOp op) {
  if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
    int c = std::get<std::string>(a).compare(std::get<std::string>(b));
    switch (op) {
      case RelationalOp::kLess:
        return c < 0;
      case RelationalOp::kLessEqual:
        return c <= 0;
      case RelationalOp::kGreater:
        return c > 0;
      case RelationalOp::kGreaterEqual:
        return c >= 0;
    }
    return false;
  }
  double x = ToNumber(a);
  double y = ToNumber(b);
  if (std::isnan(x) || std::isnan(y)) {
    return false;
  }
  switch (op) {
    case RelationalOp::kLess:
      return x < y;
    case RelationalOp::kLessEqual:
      return x <= y;
    case RelationalOp::kGreater:
      return x > y;
    case RelationalOp::kGreaterEqual:
      return x >= y;
  }
  return false;
}

Value Add(const Value& a, const Value& b) {
  Value v;
  if (std::holds_alternative<std::string>(a) || std::holds_alternative<std::string>(b)) {
    v = ToString(a) + ToString(b);
  } else {
    v = ToNumber(a) + ToNumber(b);
  }
  return v;
}

}  // namespace mtexpr
