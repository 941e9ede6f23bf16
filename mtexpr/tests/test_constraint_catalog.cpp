// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include <gtest/gtest.h>
#include "mtexpr/constraint_catalog.h"
#include "mtexpr/constraint_json.h"
#include "mtexpr/mtexpr_err.h"

using namespace mtexpr;

namespace {
Metamodel CoffeeShop() {
  Metamodel metamodel;
  metamodel.id = "mm1";
  metamodel.name = "CoffeeShop";
  metamodel.classes.resize(2);
  metamodel.classes[0].id = "c-order";
  metamodel.classes[0].name = "Order";
  metamodel.classes[1].id = "c-drink";
  metamodel.classes[1].name = "Drink";
  return metamodel;
}
}  // namespace

TEST(ConstraintCatalogTest, CreateChecksSyntax) {
  Metamodel metamodel = CoffeeShop();
  ScriptValidator validator;
  ConstraintCatalog catalog(validator);

  std::optional<ScriptConstraint> ok =
      catalog.Create(metamodel, "c-order", "hasDrinks", "self.beverages > 0", "needs drinks");
  ASSERT_TRUE(ok.has_value());
  EXPECT_TRUE(ok->is_valid);
  EXPECT_FALSE(ok->error_message.has_value());
  EXPECT_EQ("c-order", ok->context_class_id);
  EXPECT_EQ("Order", ok->context_class_name);
  EXPECT_EQ("needs drinks", ok->description);
  EXPECT_EQ(36, ok->id.size());

  std::optional<ScriptConstraint> broken =
      catalog.Create(metamodel, "c-order", "broken", "self.name.length >");
  ASSERT_TRUE(broken.has_value());
  EXPECT_FALSE(broken->is_valid);
  EXPECT_EQ(
      "Syntax error: Unexpected end of expression. Check for missing closing brackets, "
      "parentheses, or quotes.",
      *broken->error_message);
  // rejected constraints are stored too
  EXPECT_EQ(2, metamodel.classes[0].constraints.size());

  EXPECT_FALSE(catalog.Create(metamodel, "c-missing", "x", "true").has_value());
}

TEST(ConstraintCatalogTest, SameNameReplaces) {
  Metamodel metamodel = CoffeeShop();
  ScriptValidator validator;
  ConstraintCatalog catalog(validator);
  std::optional<ScriptConstraint> first = catalog.Create(metamodel, "c-order", "limit", "true");
  std::optional<ScriptConstraint> second =
      catalog.Create(metamodel, "c-order", "limit", "self.total < 100");
  ASSERT_TRUE(first && second);
  EXPECT_NE(first->id, second->id);
  ConstraintList constraints = catalog.ForClass(metamodel, "c-order");
  ASSERT_EQ(1, constraints.size());
  EXPECT_EQ("self.total < 100", constraints[0].expression);
  // the same name on another class is a different constraint
  ASSERT_TRUE(catalog.Create(metamodel, "c-drink", "limit", "true").has_value());
  EXPECT_EQ(2, catalog.All(metamodel).size());
}

TEST(ConstraintCatalogTest, UpdateAndDelete) {
  Metamodel metamodel = CoffeeShop();
  ScriptValidator validator;
  ConstraintCatalog catalog(validator);
  std::string id = catalog.Create(metamodel, "c-drink", "sized", "self.size > 0")->id;

  ConstraintUpdate update;
  update.expression = "self.size >";
  update.severity = Severity::kWarning;
  std::optional<ScriptConstraint> updated = catalog.Update(metamodel, id, update);
  ASSERT_TRUE(updated.has_value());
  EXPECT_FALSE(updated->is_valid);
  EXPECT_EQ(Severity::kWarning, updated->severity);
  EXPECT_EQ("sized", updated->name);

  update = ConstraintUpdate();
  update.expression = "self.size > 1";
  update.name = "bigger";
  updated = catalog.Update(metamodel, id, update);
  ASSERT_TRUE(updated.has_value());
  EXPECT_TRUE(updated->is_valid);
  EXPECT_FALSE(updated->error_message.has_value());
  EXPECT_EQ("bigger", metamodel.classes[1].constraints[0].name);

  EXPECT_FALSE(catalog.Update(metamodel, "nope", update).has_value());
  EXPECT_TRUE(catalog.Delete(metamodel, id));
  EXPECT_FALSE(catalog.Delete(metamodel, id));
  EXPECT_TRUE(catalog.ForClass(metamodel, "c-drink").empty());
}

TEST(ConstraintCatalogTest, GlobalConstraints) {
  Metamodel metamodel = CoffeeShop();
  ScriptValidator validator;
  ConstraintCatalog catalog(validator);
  catalog.Create(metamodel, "c-order", "a", "true");
  ScriptConstraint global = catalog.CreateGlobal(metamodel, "named", "self.name !== undefined");
  EXPECT_TRUE(global.is_valid);
  EXPECT_TRUE(global.context_class_id.empty());
  ConstraintList all = catalog.All(metamodel);
  ASSERT_EQ(2, all.size());
  EXPECT_EQ("a", all[0].name);
  EXPECT_EQ("named", all[1].name);
  EXPECT_TRUE(catalog.Delete(metamodel, global.id));
  EXPECT_TRUE(metamodel.constraints.empty());
}

TEST(ConstraintCatalogTest, NewIdsAreUnique) {
  EXPECT_NE(NewConstraintId(), NewConstraintId());
}

TEST(ConstraintJsonTest, RoundTripRecord) {
  ScriptConstraint constraint;
  constraint.id = "k1";
  constraint.name = "hasDrinks";
  constraint.context_class_id = "c-order";
  constraint.context_class_name = "Order";
  constraint.expression = "self.beverages > 0";
  constraint.severity = Severity::kInfo;
  constraint.is_valid = false;
  constraint.error_message = "Syntax error";
  std::string json = ConstraintsToJson({constraint});
  EXPECT_NE(std::string::npos, json.find("\"severity\":\"info\""));
  EXPECT_NE(std::string::npos, json.find("\"isValid\":false"));

  ConstraintList parsed;
  ASSERT_EQ(MTEXPR_OK, ParseConstraintsFromJson(json, parsed));
  ASSERT_EQ(1, parsed.size());
  EXPECT_EQ("hasDrinks", parsed[0].name);
  EXPECT_EQ(Severity::kInfo, parsed[0].severity);
  EXPECT_FALSE(parsed[0].is_valid);
  EXPECT_EQ("Syntax error", *parsed[0].error_message);
}

TEST(ConstraintJsonTest, ParseRecords) {
  ConstraintList parsed;
  ASSERT_EQ(MTEXPR_OK, ParseConstraintsFromJson(
                           R"({"id": "k2", "name": "n", "expression": "true"})", parsed));
  ASSERT_EQ(1, parsed.size());
  EXPECT_EQ(Severity::kError, parsed[0].severity);
  EXPECT_TRUE(parsed[0].is_valid);

  EXPECT_EQ(MTEXPR_ERR_INVALID_JSON,
            ParseConstraintsFromJson(R"([{"id": "k3", "severity": "fatal"}])", parsed));
  EXPECT_EQ(MTEXPR_ERR_INVALID_JSON, ParseConstraintsFromJson(R"({"name": 3})", parsed));
  EXPECT_EQ(MTEXPR_ERR_INVALID_JSON, ParseConstraintsFromJson("[1]", parsed));
  EXPECT_EQ(MTEXPR_ERR_INVALID_JSON, ParseConstraintsFromJson("{", parsed));
}

TEST(ConstraintJsonTest, Issues) {
  ValidationIssue issue;
  issue.severity = Severity::kWarning;
  issue.message = "Constraint failed";
  issue.element_id = "e1";
  issue.constraint_id = "k1";
  issue.expression = "self.size > 0";
  EXPECT_EQ(
      "[{\"severity\":\"warning\",\"message\":\"Constraint failed\",\"elementId\":\"e1\","
      "\"constraintId\":\"k1\",\"expression\":\"self.size > 0\"}]",
      IssuesToJson({issue}));
  issue.element_id.clear();
  EXPECT_EQ(std::string::npos, IssuesToJson({issue}).find("elementId"));
}
