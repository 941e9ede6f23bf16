// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <string>
#include "mtexpr/model.h"
#include "rapidjson/document.h"

namespace mtexpr {

/**
 * Constraint record shape:
 *   {"id": "...", "name": "...", "contextClassId": "...", "contextClassName": "...",
 *    "expression": "...", "description": "...", "severity": "error|warning|info",
 *    "isValid": true, "errorMessage": "..."}
 * `errorMessage` is present only for rejected constraints.
 */
void WriteConstraintJson(const ScriptConstraint& constraint, rapidjson::Value& json,
                         rapidjson::Value::AllocatorType& allocator);
std::string ConstraintsToJson(const ConstraintList& constraints, bool pretty = false);

// Missing members keep their defaults, an unknown severity is rejected.
int ParseConstraintJson(const rapidjson::Value& json, ScriptConstraint& constraint);
// Accepts a single record or an array of records.
int ParseConstraintsFromJson(const std::string& content, ConstraintList& constraints);

std::string IssuesToJson(const ValidationIssues& issues, bool pretty = false);

}  // namespace mtexpr
