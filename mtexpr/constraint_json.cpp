// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/constraint_json.h"
#include "mtexpr/mtexpr_err.h"
#include "mtexpr/mtexpr_log.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace mtexpr {

static void AddString(rapidjson::Value& json, rapidjson::Value::AllocatorType& allocator,
                      const char* name, const std::string& s) {
  rapidjson::Value json_value;
  json_value.SetString(s.data(), s.size(), allocator);
  json.AddMember(rapidjson::StringRef(name), json_value, allocator);
}

static std::string DocumentToString(const rapidjson::Document& doc, bool pretty) {
  rapidjson::StringBuffer buffer;
  if (pretty) {
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
  } else {
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
  }
  return std::string(buffer.GetString(), buffer.GetSize());
}

void WriteConstraintJson(const ScriptConstraint& constraint, rapidjson::Value& json,
                         rapidjson::Value::AllocatorType& allocator) {
  json.SetObject();
  AddString(json, allocator, "id", constraint.id);
  AddString(json, allocator, "name", constraint.name);
  AddString(json, allocator, "contextClassId", constraint.context_class_id);
  AddString(json, allocator, "contextClassName", constraint.context_class_name);
  AddString(json, allocator, "expression", constraint.expression);
  AddString(json, allocator, "description", constraint.description);
  json.AddMember("severity", rapidjson::StringRef(SeverityName(constraint.severity)), allocator);
  json.AddMember("isValid", constraint.is_valid, allocator);
  if (constraint.error_message) {
    AddString(json, allocator, "errorMessage", *constraint.error_message);
  }
}

std::string ConstraintsToJson(const ConstraintList& constraints, bool pretty) {
  rapidjson::Document doc;
  doc.SetArray();
  for (const auto& constraint : constraints) {
    rapidjson::Value item;
    WriteConstraintJson(constraint, item, doc.GetAllocator());
    doc.PushBack(item, doc.GetAllocator());
  }
  return DocumentToString(doc, pretty);
}

static bool ReadString(const rapidjson::Value& json, const char* name, std::string& s) {
  auto found = json.FindMember(name);
  if (found == json.MemberEnd() || found->value.IsNull()) {
    return true;
  }
  if (!found->value.IsString()) {
    return false;
  }
  s.assign(found->value.GetString(), found->value.GetStringLength());
  return true;
}

int ParseConstraintJson(const rapidjson::Value& json, ScriptConstraint& constraint) {
  if (!json.IsObject()) {
    return MTEXPR_ERR_INVALID_JSON;
  }
  std::string severity;
  bool ok = ReadString(json, "id", constraint.id) && ReadString(json, "name", constraint.name) &&
            ReadString(json, "contextClassId", constraint.context_class_id) &&
            ReadString(json, "contextClassName", constraint.context_class_name) &&
            ReadString(json, "expression", constraint.expression) &&
            ReadString(json, "description", constraint.description) &&
            ReadString(json, "severity", severity);
  if (!ok) {
    MTEXPR_ERROR("Constraint record has a non string member");
    return MTEXPR_ERR_INVALID_JSON;
  }
  if (!severity.empty() && !SeverityFromName(severity, constraint.severity)) {
    MTEXPR_ERROR("Unknown constraint severity '{}'", severity);
    return MTEXPR_ERR_INVALID_JSON;
  }
  auto valid = json.FindMember("isValid");
  if (valid != json.MemberEnd() && valid->value.IsBool()) {
    constraint.is_valid = valid->value.GetBool();
  }
  auto message = json.FindMember("errorMessage");
  if (message != json.MemberEnd() && message->value.IsString()) {
    constraint.error_message =
        std::string(message->value.GetString(), message->value.GetStringLength());
  }
  return MTEXPR_OK;
}

int ParseConstraintsFromJson(const std::string& content, ConstraintList& constraints) {
  rapidjson::Document d;
  d.Parse<0>(content.c_str());
  if (d.HasParseError()) {
    MTEXPR_ERROR("Invalid constraint json at offset {}", d.GetErrorOffset());
    return MTEXPR_ERR_INVALID_JSON;
  }
  if (!d.IsArray()) {
    ScriptConstraint constraint;
    int rc = ParseConstraintJson(d, constraint);
    if (0 != rc) {
      return rc;
    }
    constraints.push_back(std::move(constraint));
    return MTEXPR_OK;
  }
  for (const auto& item : d.GetArray()) {
    ScriptConstraint constraint;
    int rc = ParseConstraintJson(item, constraint);
    if (0 != rc) {
      return rc;
    }
    constraints.push_back(std::move(constraint));
  }
  return MTEXPR_OK;
}

std::string IssuesToJson(const ValidationIssues& issues, bool pretty) {
  rapidjson::Document doc;
  doc.SetArray();
  auto& allocator = doc.GetAllocator();
  for (const auto& issue : issues) {
    rapidjson::Value item(rapidjson::kObjectType);
    item.AddMember("severity", rapidjson::StringRef(SeverityName(issue.severity)), allocator);
    AddString(item, allocator, "message", issue.message);
    if (!issue.element_id.empty()) {
      AddString(item, allocator, "elementId", issue.element_id);
    }
    AddString(item, allocator, "constraintId", issue.constraint_id);
    AddString(item, allocator, "expression", issue.expression);
    doc.PushBack(item, allocator);
  }
  return DocumentToString(doc, pretty);
}

}  // namespace mtexpr
