// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/expression_parser.h"
#include <boost/algorithm/string.hpp>
#include <boost/config/warning_disable.hpp>
#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/spirit/home/x3.hpp>
#include <cctype>
#include <cmath>
#include "mtexpr/mtexpr_log.h"

BOOST_FUSION_ADAPT_STRUCT(mtexpr::ElementReference, element_name, attribute_name)

namespace mtexpr {
namespace parser {
namespace x3 = boost::spirit::x3;

struct arith_keywords_ : x3::symbols<Operator> {
  arith_keywords_() {
    add("increment", Operator::kAdd)("add", Operator::kAdd)("decrement", Operator::kSubtract)(
        "subtract", Operator::kSubtract)("multiply", Operator::kMultiply)("divide",
                                                                          Operator::kDivide);
  }
} const arith_keywords;

struct identifier_class;
struct element_reference_class;
typedef x3::rule<identifier_class, std::string> identifier_type;
typedef x3::rule<element_reference_class, ElementReference> element_reference_type;

identifier_type const identifier = "identifier";
element_reference_type const element_reference = "element_reference";

auto const identifier_def = x3::raw[x3::char_("a-zA-Z_") >> *x3::char_("a-zA-Z0-9_")];
auto const element_reference_def = identifier >> '.' >> identifier;
BOOST_SPIRIT_DEFINE(identifier, element_reference);

auto const keyword_operation = x3::omit[+x3::ascii::space] >> x3::no_case[arith_keywords] >>
                               x3::omit[+x3::ascii::space];
}  // namespace parser

namespace {
typedef std::vector<std::string> Phrase;

struct KeywordSplit {
  std::vector<Phrase> phrases;
  Operator op;
};

const std::vector<KeywordSplit>& ArithmeticSplits() {
  static const std::vector<KeywordSplit> splits = {
      {{{"increment"}, {"add"}}, Operator::kAdd},
      {{{"decrement"}, {"subtract"}}, Operator::kSubtract},
      {{{"multiply"}}, Operator::kMultiply},
      {{{"divide"}}, Operator::kDivide},
  };
  return splits;
}

// longest keyword first, `x not equals y` must not split at `equals`
const std::vector<KeywordSplit>& ComparisonSplits() {
  static const std::vector<KeywordSplit> splits = {
      {{{"greater", "than", "or", "equals"}}, Operator::kGreaterEquals},
      {{{"less", "than", "or", "equals"}}, Operator::kLessEquals},
      {{{"not", "equals"}}, Operator::kNotEquals},
      {{{"equals"}}, Operator::kEquals},
      {{{"greater", "than"}}, Operator::kGreaterThan},
      {{{"less", "than"}}, Operator::kLessThan},
  };
  return splits;
}

const std::vector<KeywordSplit>& LogicalSplits() {
  static const std::vector<KeywordSplit> splits = {
      {{{"and"}}, Operator::kAnd},
      {{{"or"}}, Operator::kOr},
  };
  return splits;
}

inline bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool MatchWordAt(const std::string& s, size_t pos, const std::string& word) {
  if (pos > s.size() || s.size() - pos < word.size()) {
    return false;
  }
  for (size_t i = 0; i < word.size(); i++) {
    if (std::tolower(static_cast<unsigned char>(s[pos + i])) != word[i]) {
      return false;
    }
  }
  return true;
}

// Case insensitive match of `phrase` at `pos`, its words separated by whitespace runs.
bool MatchPhraseAt(const std::string& s, size_t pos, const Phrase& phrase, size_t& end) {
  for (size_t i = 0; i < phrase.size(); i++) {
    if (i > 0) {
      size_t gap = pos;
      while (pos < s.size() && IsSpace(s[pos])) {
        pos++;
      }
      if (pos == gap) {
        return false;
      }
    }
    if (!MatchWordAt(s, pos, phrase[i])) {
      return false;
    }
    pos += phrase[i].size();
  }
  end = pos;
  return true;
}

/**
 * Finds `<left> <keyword> <right>` in trimmed input. The left operand is greedy, so the
 * last occurrence of the keyword wins. Linear in the input length.
 */
bool SplitAtKeyword(const std::string& input, const std::vector<KeywordSplit>& splits,
                    Operator& op, std::string& left, std::string& right) {
  for (const auto& split : splits) {
    for (size_t pos = input.size(); pos-- > 2;) {
      if (!IsSpace(input[pos - 1])) {
        continue;
      }
      for (const auto& phrase : split.phrases) {
        size_t end = 0;
        if (!MatchPhraseAt(input, pos, phrase, end) || end + 1 >= input.size() ||
            !IsSpace(input[end])) {
          continue;
        }
        op = split.op;
        left = boost::algorithm::trim_copy(input.substr(0, pos));
        right = boost::algorithm::trim_copy(input.substr(end));
        return true;
      }
    }
  }
  return false;
}

// `keyword` (single spaces between words) followed by whitespace, anywhere in the input.
bool ContainsKeyword(const std::string& input, const char* keyword, bool space_before) {
  std::string word(keyword);
  for (size_t pos = space_before ? 1 : 0; pos + word.size() < input.size(); pos++) {
    if (space_before && !IsSpace(input[pos - 1])) {
      continue;
    }
    if (MatchWordAt(input, pos, word) && IsSpace(input[pos + word.size()])) {
      return true;
    }
  }
  return false;
}

bool ContainsAnyKeyword(const std::string& input, const std::vector<const char*>& keywords,
                        bool space_before) {
  for (const char* keyword : keywords) {
    if (ContainsKeyword(input, keyword, space_before)) {
      return true;
    }
  }
  return false;
}

struct BracedToken {
  size_t pos;
  size_t len;
};

// Non overlapping `{...}` tokens whose content is not empty and has no brace.
std::vector<BracedToken> FindBracedTokens(const std::string& input) {
  std::vector<BracedToken> tokens;
  size_t pos = input.find('{');
  while (pos != std::string::npos) {
    size_t close = input.find_first_of("{}", pos + 1);
    if (close == std::string::npos) {
      break;
    }
    if (input[close] == '{') {
      pos = close;
      continue;
    }
    if (close > pos + 1) {
      tokens.push_back({pos, close - pos + 1});
    }
    pos = input.find('{', close + 1);
  }
  return tokens;
}

// First `(...)` holding no parenthesis.
bool FindInnermostGroup(const std::string& input, size_t& pos, size_t& len) {
  size_t open = input.find('(');
  while (open != std::string::npos) {
    size_t next = input.find_first_of("()", open + 1);
    if (next == std::string::npos) {
      return false;
    }
    if (input[next] == ')') {
      pos = open;
      len = next - open + 1;
      return true;
    }
    open = next;
  }
  return false;
}

// Swaps the placeholder literal for the parsed group, recomputing aggregated references
// on the way back up. Literals that merely contain the placeholder get the group text back.
bool ReplacePlaceholder(ExpressionPtr& slot, const std::string& placeholder,
                        ExpressionPtr& nested, const std::string& group_text) {
  if (!slot || !nested) {
    return false;
  }
  switch (slot->Type()) {
    case ExpressionType::kLiteral: {
      auto* s = std::get_if<std::string>(&slot->As<Literal>()->value);
      if (s == nullptr) {
        return false;
      }
      if (*s == placeholder) {
        slot = std::move(nested);
        return true;
      }
      if (s->find(placeholder) != std::string::npos) {
        boost::algorithm::replace_all(*s, placeholder, group_text);
      }
      return false;
    }
    case ExpressionType::kReference: {
      return false;
    }
    case ExpressionType::kOperation: {
      Operation* op = slot->As<Operation>();
      bool replaced = ReplacePlaceholder(op->left, placeholder, nested, group_text) ||
                      ReplacePlaceholder(op->right, placeholder, nested, group_text);
      if (replaced) {
        op->references.clear();
        if (op->left) {
          const ReferenceList& l = op->left->References();
          op->references.insert(op->references.end(), l.begin(), l.end());
        }
        if (op->right) {
          const ReferenceList& r = op->right->References();
          op->references.insert(op->references.end(), r.begin(), r.end());
        }
      }
      return replaced;
    }
    case ExpressionType::kCompound: {
      Compound* c = slot->As<Compound>();
      return ReplacePlaceholder(c->left, placeholder, nested, group_text) ||
             ReplacePlaceholder(c->right, placeholder, nested, group_text);
    }
  }
  return false;
}

// `a.b.c` splits like the legacy editor did: element `a`, attribute `b`.
bool SplitBracedContent(const std::string& content, ElementReference& ref) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, content, boost::algorithm::is_any_of("."));
  if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
    return false;
  }
  ref.element_name = parts[0];
  ref.attribute_name = parts[1];
  return true;
}
}  // namespace

bool ParseElementReference(std::string_view text, ElementReference& ref) {
  namespace x3 = boost::spirit::x3;
  auto first = text.begin();
  auto last = text.end();
  ElementReference parsed;
  if (!x3::parse(first, last, parser::element_reference, parsed) || first != last) {
    return false;
  }
  ref = std::move(parsed);
  return true;
}

bool IsIdentifier(std::string_view text) {
  namespace x3 = boost::spirit::x3;
  auto first = text.begin();
  auto last = text.end();
  return x3::parse(first, last, parser::identifier) && first == last;
}

ExpressionParser::ExpressionParser(const ParseOptions& options) : options_(options) {}

ExpressionPtr ExpressionParser::Parse(std::string_view input) { return ParseText(input, true); }

ExpressionPtr ExpressionParser::ParseText(std::string_view text, bool top_level) {
  std::string input = boost::algorithm::trim_copy(std::string(text));
  if (input.empty()) {
    return nullptr;
  }
  static const std::vector<const char*> arith_keywords = {"increment", "decrement", "multiply",
                                                          "add",       "subtract",  "divide"};
  static const std::vector<const char*> compare_keywords = {
      "equals",          "greater than", "less than", "greater than or equals",
      "less than or equals", "not equals"};
  static const std::vector<const char*> logical_keywords = {"and", "or"};

  if (depth_ >= options_.max_depth) {
    MTEXPR_WARN("Expression nesting exceeds max depth {}, kept as text", options_.max_depth);
    return MakeLiteral(Value(input));
  }
  DepthGuard guard(depth_);

  ExpressionPtr direct;
  if (ParseDirectReference(input, direct)) {
    return direct;
  }
  if (!FindBracedTokens(input).empty()) {
    return ParseBracedReferences(input);
  }
  if (input.find('(') != std::string::npos && input.find(')') != std::string::npos) {
    return ParseNested(input, top_level);
  }
  if (ContainsAnyKeyword(input, arith_keywords, false)) {
    return ParseArithmetic(input);
  }
  if (ContainsAnyKeyword(input, compare_keywords, false)) {
    return ParseComparison(input);
  }
  if (ContainsAnyKeyword(input, logical_keywords, true)) {
    return ParseLogical(input);
  }
  if (top_level && !options_.allow_literal_fallback) {
    return nullptr;
  }
  if (input == "true" || input == "false") {
    return MakeLiteral(Value(input == "true"));
  }
  return MakeLiteral(Value(input));
}

bool ExpressionParser::ParseDirectReference(const std::string& input, ExpressionPtr& result) {
  namespace x3 = boost::spirit::x3;
  auto first = input.cbegin();
  auto last = input.cend();
  ElementReference ref;
  if (!x3::parse(first, last, parser::element_reference, ref)) {
    return false;
  }
  if (first == last) {
    CheckAvailable(ref);
    result = MakeReference(ref.element_name, ref.attribute_name);
    return true;
  }
  if (!std::isspace(static_cast<unsigned char>(*first))) {
    return false;
  }
  Operator op = Operator::kInvalid;
  if (!x3::parse(first, last, parser::keyword_operation, op) || first == last) {
    return false;
  }
  CheckAvailable(ref);
  ExpressionPtr left = MakeReference(ref.element_name, ref.attribute_name);
  ExpressionPtr right = ParseText(std::string(first, last), false);
  result = MakeOperation(op, std::move(left), std::move(right));
  return true;
}

ExpressionPtr ExpressionParser::ParseBracedReferences(const std::string& input) {
  std::vector<std::string> tokens;
  std::vector<std::string> contents;
  for (const auto& token : FindBracedTokens(input)) {
    tokens.push_back(input.substr(token.pos, token.len));
    contents.push_back(input.substr(token.pos + 1, token.len - 2));
  }
  if (tokens.empty()) {
    return nullptr;
  }

  bool all_dotted = true;
  for (const auto& content : contents) {
    ElementReference ref;
    if (!ParseElementReference(content, ref)) {
      all_dotted = false;
      break;
    }
  }
  if (all_dotted) {
    // serializer output wraps references in braces, dotted form parses the operators
    std::string normalized = input;
    for (size_t i = 0; i < tokens.size(); i++) {
      boost::algorithm::replace_first(normalized, tokens[i], contents[i]);
    }
    ExpressionPtr reparsed = ParseText(normalized, false);
    if (reparsed && reparsed->IsOperationOrCompound()) {
      return reparsed;
    }
  }

  if (tokens.size() > 1) {
    std::string processed = input;
    ReferenceList refs;
    for (size_t i = 0; i < tokens.size(); i++) {
      ElementReference ref;
      if (SplitBracedContent(contents[i], ref)) {
        refs.push_back(ref);
        boost::algorithm::replace_first(processed, tokens[i], fmt::format("__REF{}__", i));
      }
    }
    if (refs.empty()) {
      MTEXPR_ERROR("Invalid reference format in '{}'. Must be {{elementName.attributeName}}",
                   input);
      return nullptr;
    }
    if (processed.find("increment") != std::string::npos) {
      return MakeOperation(Operator::kAdd, MakeReference({refs[0]}), MakeLiteral(1.0), refs);
    }
    if (processed.find("decrement") != std::string::npos) {
      return MakeOperation(Operator::kSubtract, MakeReference({refs[0]}), MakeLiteral(1.0), refs);
    }
    size_t multiply = processed.find("multiply");
    if (multiply != std::string::npos) {
      std::string rest = processed.substr(multiply + 8);
      size_t next = rest.find("multiply");
      if (next != std::string::npos) {
        rest = rest.substr(0, next);
      }
      boost::algorithm::trim(rest);
      boost::algorithm::replace_first(rest, "__REF", "");
      double factor = ParseFloatPrefix(rest);
      if (std::isnan(factor) || factor == 0) {
        factor = 1;
      }
      return MakeOperation(Operator::kMultiply, MakeReference({refs[0]}), MakeLiteral(factor),
                           refs);
    }
    return MakeReference(std::move(refs));
  }

  ElementReference ref;
  if (!SplitBracedContent(contents[0], ref)) {
    MTEXPR_ERROR("Invalid reference format '{}'. Must be {{elementName.attributeName}}",
                 tokens[0]);
    return nullptr;
  }
  CheckAvailable(ref);
  return MakeReference(ref.element_name, ref.attribute_name);
}

ExpressionPtr ExpressionParser::ParseNested(const std::string& input, bool top_level) {
  size_t group_pos = 0;
  size_t group_len = 0;
  if (!FindInnermostGroup(input, group_pos, group_len)) {
    return nullptr;
  }
  std::string group = input.substr(group_pos, group_len);
  bool whole = group == input;
  ExpressionPtr nested = ParseText(group.substr(1, group.size() - 2), top_level && whole);
  if (!nested) {
    return nullptr;
  }
  nested->is_nested = true;
  if (whole) {
    return nested;
  }

  std::string placeholder = fmt::format("__NESTED_{}__", nested_seq_++);
  std::string updated = input;
  updated.replace(group_pos, group.size(), placeholder);
  ExpressionPtr outer = ParseText(updated, top_level);
  if (!outer) {
    return nested;
  }
  ReplacePlaceholder(outer, placeholder, nested, group);
  return outer;
}

ExpressionPtr ExpressionParser::ParseArithmetic(const std::string& input) {
  Operator op;
  std::string left, right;
  if (!SplitAtKeyword(input, ArithmeticSplits(), op, left, right)) {
    return nullptr;
  }
  ExpressionPtr l = ParseText(left, false);
  ExpressionPtr r = ParseText(right, false);
  return MakeOperation(op, std::move(l), std::move(r));
}

ExpressionPtr ExpressionParser::ParseComparison(const std::string& input) {
  Operator op;
  std::string left, right;
  if (!SplitAtKeyword(input, ComparisonSplits(), op, left, right)) {
    return nullptr;
  }
  ExpressionPtr l = ParseText(left, false);
  ExpressionPtr r = ParseText(right, false);
  return MakeOperation(op, std::move(l), std::move(r));
}

ExpressionPtr ExpressionParser::ParseLogical(const std::string& input) {
  Operator op;
  std::string left, right;
  if (!SplitAtKeyword(input, LogicalSplits(), op, left, right)) {
    return nullptr;
  }
  ExpressionPtr l = ParseText(left, false);
  ExpressionPtr r = ParseText(right, false);
  return MakeCompound(op, std::move(l), std::move(r));
}

void ExpressionParser::CheckAvailable(const ElementReference& ref) {
  if (nullptr == options_.available_elements || options_.available_elements->empty()) {
    return;
  }
  for (const auto& element : *options_.available_elements) {
    if (element.name == ref.element_name) {
      return;
    }
  }
  MTEXPR_WARN("Referenced element \"{}\" not found in available elements", ref.element_name);
}

ExpressionPtr ParseExpression(std::string_view input, const ParseOptions& options) {
  ExpressionParser parser(options);
  return parser.Parse(input);
}

}  // namespace mtexpr
