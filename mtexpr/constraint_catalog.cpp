// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/constraint_catalog.h"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "mtexpr/mtexpr_log.h"

namespace mtexpr {

std::string NewConstraintId() {
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

void ConstraintCatalog::Check(ScriptConstraint& constraint) const {
  SyntaxCheck check = validator_.ValidateSyntax(constraint.expression);
  constraint.is_valid = check.valid;
  if (check.valid) {
    constraint.error_message.reset();
  } else {
    constraint.error_message =
        check.issues.empty() ? "Invalid JavaScript expression" : check.issues[0].message;
  }
}

std::optional<ScriptConstraint> ConstraintCatalog::Create(Metamodel& metamodel,
                                                          const std::string& class_id,
                                                          const std::string& name,
                                                          const std::string& expression,
                                                          const std::string& description,
                                                          Severity severity) const {
  MetaClass* cls = metamodel.FindClass(class_id);
  if (nullptr == cls) {
    MTEXPR_ERROR("No metaclass {} in metamodel {}", class_id, metamodel.id);
    return std::nullopt;
  }
  ScriptConstraint constraint;
  constraint.id = NewConstraintId();
  constraint.name = name;
  constraint.context_class_id = cls->id;
  constraint.context_class_name = cls->name;
  constraint.expression = expression;
  constraint.description = description;
  constraint.severity = severity;
  Check(constraint);
  if (!constraint.is_valid) {
    MTEXPR_WARN("Constraint '{}' on {} does not compile: {}", name, cls->name,
                *constraint.error_message);
  }
  for (auto& existing : cls->constraints) {
    if (existing.name == name) {
      existing = constraint;
      return constraint;
    }
  }
  cls->constraints.push_back(constraint);
  return constraint;
}

ScriptConstraint ConstraintCatalog::CreateGlobal(Metamodel& metamodel, const std::string& name,
                                                 const std::string& expression,
                                                 const std::string& description,
                                                 Severity severity) const {
  ScriptConstraint constraint;
  constraint.id = NewConstraintId();
  constraint.name = name;
  constraint.expression = expression;
  constraint.description = description;
  constraint.severity = severity;
  Check(constraint);
  metamodel.constraints.push_back(constraint);
  return constraint;
}

static ScriptConstraint* FindConstraint(Metamodel& metamodel, const std::string& constraint_id) {
  for (auto& cls : metamodel.classes) {
    for (auto& c : cls.constraints) {
      if (c.id == constraint_id) {
        return &c;
      }
    }
  }
  for (auto& c : metamodel.constraints) {
    if (c.id == constraint_id) {
      return &c;
    }
  }
  return nullptr;
}

std::optional<ScriptConstraint> ConstraintCatalog::Update(Metamodel& metamodel,
                                                          const std::string& constraint_id,
                                                          const ConstraintUpdate& update) const {
  ScriptConstraint* constraint = FindConstraint(metamodel, constraint_id);
  if (nullptr == constraint) {
    MTEXPR_ERROR("No constraint {} in metamodel {}", constraint_id, metamodel.id);
    return std::nullopt;
  }
  if (update.name) {
    constraint->name = *update.name;
  }
  if (update.description) {
    constraint->description = *update.description;
  }
  if (update.severity) {
    constraint->severity = *update.severity;
  }
  if (update.expression && *update.expression != constraint->expression) {
    constraint->expression = *update.expression;
    Check(*constraint);
  }
  return *constraint;
}

static bool EraseConstraint(ConstraintList& constraints, const std::string& constraint_id) {
  for (auto it = constraints.begin(); it != constraints.end(); ++it) {
    if (it->id == constraint_id) {
      constraints.erase(it);
      return true;
    }
  }
  return false;
}

bool ConstraintCatalog::Delete(Metamodel& metamodel, const std::string& constraint_id) const {
  for (auto& cls : metamodel.classes) {
    if (EraseConstraint(cls.constraints, constraint_id)) {
      return true;
    }
  }
  if (EraseConstraint(metamodel.constraints, constraint_id)) {
    return true;
  }
  MTEXPR_WARN("No constraint {} to delete in metamodel {}", constraint_id, metamodel.id);
  return false;
}

ConstraintList ConstraintCatalog::ForClass(const Metamodel& metamodel,
                                           const std::string& class_id) const {
  const MetaClass* cls = metamodel.FindClass(class_id);
  if (nullptr == cls) {
    MTEXPR_ERROR("No metaclass {} in metamodel {}", class_id, metamodel.id);
    return ConstraintList();
  }
  return cls->constraints;
}

ConstraintList ConstraintCatalog::All(const Metamodel& metamodel) const {
  ConstraintList all;
  for (const auto& cls : metamodel.classes) {
    all.insert(all.end(), cls.constraints.begin(), cls.constraints.end());
  }
  all.insert(all.end(), metamodel.constraints.begin(), metamodel.constraints.end());
  return all;
}

}  // namespace mtexpr
