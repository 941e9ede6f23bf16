// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <optional>
#include <string>
#include "mtexpr/model.h"
#include "mtexpr/script_validator.h"

namespace mtexpr {

struct ConstraintUpdate {
  std::optional<std::string> name;
  std::optional<std::string> expression;
  std::optional<std::string> description;
  std::optional<Severity> severity;
};

/**
 * Script constraints stored on a metamodel: per metaclass, or global on the metamodel
 * itself. Every expression is syntax checked when it is stored, a rejected one is kept with
 * `is_valid == false` and the checker's message.
 */
class ConstraintCatalog {
 public:
  explicit ConstraintCatalog(const ScriptValidator& validator) : validator_(validator) {}

  // Replaces a constraint of the same name on the same class. Null when the class is missing.
  std::optional<ScriptConstraint> Create(Metamodel& metamodel, const std::string& class_id,
                                         const std::string& name, const std::string& expression,
                                         const std::string& description = "",
                                         Severity severity = Severity::kError) const;
  // Adds a constraint that applies to every element.
  ScriptConstraint CreateGlobal(Metamodel& metamodel, const std::string& name,
                                const std::string& expression,
                                const std::string& description = "",
                                Severity severity = Severity::kError) const;
  std::optional<ScriptConstraint> Update(Metamodel& metamodel, const std::string& constraint_id,
                                         const ConstraintUpdate& update) const;
  // Class constraints are searched first, then the global ones.
  bool Delete(Metamodel& metamodel, const std::string& constraint_id) const;

  ConstraintList ForClass(const Metamodel& metamodel, const std::string& class_id) const;
  // Class constraints in class order, then the global ones.
  ConstraintList All(const Metamodel& metamodel) const;

 private:
  void Check(ScriptConstraint& constraint) const;

  const ScriptValidator& validator_;
};

std::string NewConstraintId();

}  // namespace mtexpr
