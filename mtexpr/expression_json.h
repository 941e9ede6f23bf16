// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <string>
#include "mtexpr/expression.h"
#include "rapidjson/document.h"

namespace mtexpr {

// Integral numbers are written as JSON integers.
void WriteValueJson(const Value& v, rapidjson::Value& json,
                    rapidjson::Value::AllocatorType& allocator);
// Objects and arrays are not attribute values, they are rejected.
bool ParseValueJson(const rapidjson::Value& json, Value& v);

/**
 * Persisted expression shape:
 *   {"type": "LITERAL|REFERENCE|OPERATION|COMPOUND", "value": ..., "operator": "ADD",
 *    "leftOperand": {...}, "rightOperand": {...},
 *    "references": [{"elementName": "...", "attributeName": "..."}], "isNested": true}
 */
void WriteExpressionJson(const Expression& expr, rapidjson::Value& json,
                         rapidjson::Value::AllocatorType& allocator);
std::string ExpressionToJson(const Expression& expr);

// Returns MTEXPR_OK or MTEXPR_ERR_INVALID_JSON/MTEXPR_ERR_INVALID_EXPR_TYPE.
int ParseExpressionJson(const rapidjson::Value& json, ExpressionPtr& expr);
int ParseExpressionFromJson(const std::string& content, ExpressionPtr& expr);

}  // namespace mtexpr
