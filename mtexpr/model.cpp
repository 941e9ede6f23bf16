// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/model.h"

namespace mtexpr {

std::optional<Value> ModelElement::GetProperty(const std::string& key) const {
  if (key == "id") {
    return Value(id);
  }
  if (key == "name") {
    if (name) {
      return Value(*name);
    }
    return std::nullopt;
  }
  if (key == "type") {
    if (type) {
      return Value(*type);
    }
    return std::nullopt;
  }
  if (key == "modelElementId") {
    return Value(model_element_id);
  }
  auto found = properties.find(key);
  if (found != properties.end()) {
    return found->second;
  }
  return std::nullopt;
}

const char* SeverityName(Severity s) {
  switch (s) {
    case Severity::kError:
      return "error";
    case Severity::kWarning:
      return "warning";
    case Severity::kInfo:
      return "info";
  }
  return "error";
}

bool SeverityFromName(std::string_view name, Severity& s) {
  if (name == "error") {
    s = Severity::kError;
  } else if (name == "warning") {
    s = Severity::kWarning;
  } else if (name == "info") {
    s = Severity::kInfo;
  } else {
    return false;
  }
  return true;
}

const MetaClass* Metamodel::FindClass(const std::string& class_id) const {
  for (const auto& cls : classes) {
    if (cls.id == class_id) {
      return &cls;
    }
  }
  return nullptr;
}

MetaClass* Metamodel::FindClass(const std::string& class_id) {
  for (auto& cls : classes) {
    if (cls.id == class_id) {
      return &cls;
    }
  }
  return nullptr;
}

const ModelElement* Model::FindElement(const std::string& element_id) const {
  for (const auto& element : elements) {
    if (element.id == element_id) {
      return &element;
    }
  }
  return nullptr;
}

bool AttributeNameIs(const AttributeMap& attrs, const char* key, const std::string& name) {
  auto found = attrs.find(key);
  if (found == attrs.end()) {
    return false;
  }
  const std::string* s = std::get_if<std::string>(&found->second);
  return s != nullptr && *s == name;
}

}  // namespace mtexpr
