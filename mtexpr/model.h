// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "mtexpr/expression.h"
#include "mtexpr/value.h"

namespace mtexpr {

// A reference slot: a single (possibly unset) target or a list of targets.
struct ReferenceValue {
  bool many = false;
  std::vector<std::string> targets;

  static ReferenceValue Single(const std::string& target) {
    ReferenceValue v;
    v.targets.push_back(target);
    return v;
  }
  static ReferenceValue Many(std::vector<std::string> targets) {
    ReferenceValue v;
    v.many = true;
    v.targets = std::move(targets);
    return v;
  }
  static ReferenceValue Unset() { return ReferenceValue(); }
};
typedef std::map<std::string, ReferenceValue> ReferenceMap;

struct ModelElement {
  std::string id;
  std::optional<std::string> name;
  std::optional<std::string> type;
  std::string model_element_id;  // metaclass id
  AttributeMap style;
  AttributeMap attributes;
  AttributeMap properties;
  ReferenceMap references;

  // Direct top-level property: id, name, type, modelElementId, then `properties`.
  std::optional<Value> GetProperty(const std::string& key) const;
};

typedef std::variant<Value, std::shared_ptr<const Expression>> AttributeValue;
typedef std::map<std::string, AttributeValue> PatternAttributeMap;

struct Position {
  double x = 0;
  double y = 0;
};

struct PatternElement {
  std::string id;
  std::string name;
  std::string type;
  PatternAttributeMap attributes;
  ReferenceMap references;
  std::optional<Position> position;
};

enum class Severity { kError = 0, kWarning, kInfo };
const char* SeverityName(Severity s);
bool SeverityFromName(std::string_view name, Severity& s);

struct ScriptConstraint {
  std::string id;
  std::string name;
  std::string context_class_id;
  std::string context_class_name;
  std::string expression;
  std::string description;
  Severity severity = Severity::kError;
  bool is_valid = true;
  std::optional<std::string> error_message;
};
typedef std::vector<ScriptConstraint> ConstraintList;

struct MetaAttribute {
  std::string id;
  std::string name;
  std::string type;
};

struct MetaReference {
  std::string id;
  std::string name;
  std::string target;
};

struct MetaClass {
  std::string id;
  std::string name;
  bool abstract = false;
  std::vector<std::string> super_types;
  std::vector<MetaAttribute> attributes;
  std::vector<MetaReference> references;
  ConstraintList constraints;
};

struct Metamodel {
  std::string id;
  std::string name;
  std::vector<MetaClass> classes;
  ConstraintList constraints;  // global

  const MetaClass* FindClass(const std::string& class_id) const;
  MetaClass* FindClass(const std::string& class_id);
};

struct Model {
  std::string id;
  std::string name;
  std::string metamodel_id;
  std::vector<ModelElement> elements;

  const ModelElement* FindElement(const std::string& element_id) const;
};

struct PatternMatch {
  std::string pattern_id;
  std::map<std::string, std::string> matches;  // pattern element id -> model element id
  bool valid = true;
};

typedef std::map<std::string, PatternElement> PatternElementMap;
typedef std::map<std::string, ModelElement> ModelElementMap;

/**
 * Evaluation inputs. Every member is optional and borrowed, the caller keeps the
 * snapshots alive for the duration of the evaluation.
 */
struct EvaluationContext {
  const PatternMatch* pattern_match = nullptr;
  const PatternElementMap* pattern_elements = nullptr;
  const ModelElementMap* model_elements = nullptr;
  const std::vector<PatternElement>* all_pattern_elements = nullptr;
  const std::vector<ModelElement>* all_model_elements = nullptr;
};

struct ValidationIssue {
  Severity severity = Severity::kError;
  std::string message;
  std::string element_id;
  std::string constraint_id;
  std::string expression;
};
typedef std::vector<ValidationIssue> ValidationIssues;

// Canonical key first, then the legacy "attr-" prefixed key.
template <typename Map>
const typename Map::mapped_type* FindAttribute(const Map& attrs, const std::string& name) {
  auto found = attrs.find(name);
  if (found != attrs.end()) {
    return &(found->second);
  }
  found = attrs.find("attr-" + name);
  if (found != attrs.end()) {
    return &(found->second);
  }
  return nullptr;
}

// True when `attrs[key]` is the string `name`.
bool AttributeNameIs(const AttributeMap& attrs, const char* key, const std::string& name);

}  // namespace mtexpr
