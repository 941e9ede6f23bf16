// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/expression_json.h"
#include <cmath>
#include "mtexpr/mtexpr_err.h"
#include "mtexpr/mtexpr_log.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace mtexpr {

void WriteValueJson(const Value& v, rapidjson::Value& json,
                    rapidjson::Value::AllocatorType& allocator) {
  switch (v.index()) {
    case 0: {
      json.SetNull();
      break;
    }
    case 1: {
      json.SetBool(std::get<bool>(v));
      break;
    }
    case 2: {
      double d = std::get<double>(v);
      if (std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
        json.SetInt64(static_cast<int64_t>(d));
      } else if (std::isfinite(d)) {
        json.SetDouble(d);
      } else {
        // JSON has no NaN/Infinity
        json.SetNull();
      }
      break;
    }
    default: {
      const std::string& s = std::get<std::string>(v);
      json.SetString(s.data(), s.size(), allocator);
      break;
    }
  }
}

bool ParseValueJson(const rapidjson::Value& json, Value& v) {
  if (json.IsNull()) {
    v = Null();
  } else if (json.IsBool()) {
    v = json.GetBool();
  } else if (json.IsNumber()) {
    v = json.GetDouble();
  } else if (json.IsString()) {
    v = std::string(json.GetString(), json.GetStringLength());
  } else {
    return false;
  }
  return true;
}

static void AddString(rapidjson::Value& json, rapidjson::Value::AllocatorType& allocator,
                      const char* name, const std::string& s) {
  rapidjson::Value json_value;
  json_value.SetString(s.data(), s.size(), allocator);
  json.AddMember(rapidjson::StringRef(name), json_value, allocator);
}

static void WriteReferences(const ReferenceList& refs, rapidjson::Value& json,
                            rapidjson::Value::AllocatorType& allocator) {
  rapidjson::Value array(rapidjson::kArrayType);
  for (const auto& ref : refs) {
    rapidjson::Value item(rapidjson::kObjectType);
    AddString(item, allocator, "elementName", ref.element_name);
    AddString(item, allocator, "attributeName", ref.attribute_name);
    array.PushBack(item, allocator);
  }
  json.AddMember("references", array, allocator);
}

static void WriteOperand(const char* name, const ExpressionPtr& operand, rapidjson::Value& json,
                         rapidjson::Value::AllocatorType& allocator) {
  if (!operand) {
    return;
  }
  rapidjson::Value json_value(rapidjson::kObjectType);
  WriteExpressionJson(*operand, json_value, allocator);
  json.AddMember(rapidjson::StringRef(name), json_value, allocator);
}

void WriteExpressionJson(const Expression& expr, rapidjson::Value& json,
                         rapidjson::Value::AllocatorType& allocator) {
  json.SetObject();
  json.AddMember("type", rapidjson::StringRef(ExpressionTypeName(expr.Type())), allocator);
  rapidjson::Value value;
  if (auto literal = expr.As<Literal>()) {
    WriteValueJson(literal->value, value, allocator);
  }
  json.AddMember("value", value, allocator);
  switch (expr.Type()) {
    case ExpressionType::kReference: {
      WriteReferences(expr.As<Reference>()->references, json, allocator);
      break;
    }
    case ExpressionType::kOperation: {
      const Operation* op = expr.As<Operation>();
      json.AddMember("operator", rapidjson::StringRef(OperatorName(op->op)), allocator);
      WriteOperand("leftOperand", op->left, json, allocator);
      WriteOperand("rightOperand", op->right, json, allocator);
      WriteReferences(op->references, json, allocator);
      break;
    }
    case ExpressionType::kCompound: {
      const Compound* c = expr.As<Compound>();
      json.AddMember("operator", rapidjson::StringRef(OperatorName(c->op)), allocator);
      WriteOperand("leftOperand", c->left, json, allocator);
      WriteOperand("rightOperand", c->right, json, allocator);
      break;
    }
    default: {
      break;
    }
  }
  if (expr.is_nested) {
    json.AddMember("isNested", true, allocator);
  }
}

std::string ExpressionToJson(const Expression& expr) {
  rapidjson::Document doc;
  WriteExpressionJson(expr, doc, doc.GetAllocator());
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  doc.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

static bool ParseReferences(const rapidjson::Value& json, ReferenceList& refs) {
  auto found = json.FindMember("references");
  if (found == json.MemberEnd() || found->value.IsNull()) {
    return true;
  }
  if (!found->value.IsArray()) {
    return false;
  }
  for (const auto& item : found->value.GetArray()) {
    if (!item.IsObject()) {
      return false;
    }
    ElementReference ref;
    auto element = item.FindMember("elementName");
    auto attribute = item.FindMember("attributeName");
    if (element != item.MemberEnd() && element->value.IsString()) {
      ref.element_name = element->value.GetString();
    }
    if (attribute != item.MemberEnd() && attribute->value.IsString()) {
      ref.attribute_name = attribute->value.GetString();
    }
    refs.push_back(std::move(ref));
  }
  return true;
}

static int ParseOperand(const rapidjson::Value& json, const char* name, ExpressionPtr& operand) {
  auto found = json.FindMember(name);
  if (found == json.MemberEnd() || found->value.IsNull()) {
    return MTEXPR_OK;
  }
  return ParseExpressionJson(found->value, operand);
}

static Operator ParseOperator(const rapidjson::Value& json) {
  auto found = json.FindMember("operator");
  if (found == json.MemberEnd() || !found->value.IsString()) {
    return Operator::kInvalid;
  }
  Operator op = OperatorFromName(found->value.GetString());
  if (op == Operator::kInvalid) {
    MTEXPR_WARN("Unknown expression operator '{}'", found->value.GetString());
  }
  return op;
}

int ParseExpressionJson(const rapidjson::Value& json, ExpressionPtr& expr) {
  if (!json.IsObject()) {
    return MTEXPR_ERR_INVALID_JSON;
  }
  auto type_member = json.FindMember("type");
  if (type_member == json.MemberEnd() || !type_member->value.IsString()) {
    return MTEXPR_ERR_INVALID_EXPR_TYPE;
  }
  std::string type = type_member->value.GetString();
  ExpressionPtr result;
  if (type == "LITERAL") {
    Value v;
    auto value_member = json.FindMember("value");
    if (value_member != json.MemberEnd() && !ParseValueJson(value_member->value, v)) {
      return MTEXPR_ERR_INVALID_JSON;
    }
    result = MakeLiteral(std::move(v));
  } else if (type == "REFERENCE") {
    ReferenceList refs;
    if (!ParseReferences(json, refs)) {
      return MTEXPR_ERR_INVALID_JSON;
    }
    result = MakeReference(std::move(refs));
  } else if (type == "OPERATION") {
    ExpressionPtr left, right;
    int rc = ParseOperand(json, "leftOperand", left);
    if (0 != rc) {
      return rc;
    }
    rc = ParseOperand(json, "rightOperand", right);
    if (0 != rc) {
      return rc;
    }
    Operator op = ParseOperator(json);
    if (json.HasMember("references")) {
      ReferenceList refs;
      if (!ParseReferences(json, refs)) {
        return MTEXPR_ERR_INVALID_JSON;
      }
      result = MakeOperation(op, std::move(left), std::move(right), std::move(refs));
    } else {
      result = MakeOperation(op, std::move(left), std::move(right));
    }
  } else if (type == "COMPOUND") {
    ExpressionPtr left, right;
    int rc = ParseOperand(json, "leftOperand", left);
    if (0 != rc) {
      return rc;
    }
    rc = ParseOperand(json, "rightOperand", right);
    if (0 != rc) {
      return rc;
    }
    result = MakeCompound(ParseOperator(json), std::move(left), std::move(right));
  } else {
    MTEXPR_ERROR("Unknown expression type '{}'", type);
    return MTEXPR_ERR_INVALID_EXPR_TYPE;
  }
  auto nested = json.FindMember("isNested");
  if (nested != json.MemberEnd() && nested->value.IsBool()) {
    result->is_nested = nested->value.GetBool();
  }
  expr = std::move(result);
  return MTEXPR_OK;
}

int ParseExpressionFromJson(const std::string& content, ExpressionPtr& expr) {
  rapidjson::Document d;
  d.Parse<0>(content.c_str());
  if (d.HasParseError()) {
    MTEXPR_ERROR("Invalid expression json at offset {}", d.GetErrorOffset());
    return MTEXPR_ERR_INVALID_JSON;
  }
  return ParseExpressionJson(d, expr);
}

}  // namespace mtexpr
