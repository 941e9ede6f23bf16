// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include "mtexpr/model.h"

namespace mtexpr {

/**
 * Resolves `element.attribute` against an EvaluationContext. Strategies, in order:
 *   1. pattern elements by name, reading their attributes
 *   2. the model element the pattern match maps that pattern element to
 *   3. model elements whose style/attributes `name` equals the element name
 *   4. the element name used directly as a pattern element id of the match
 *   5. the flat pattern element list, then the flat model element list
 * A pattern attribute may hold an Expression, the caller decides how to evaluate it.
 */
class ReferenceResolver {
 public:
  explicit ReferenceResolver(const EvaluationContext& ctx);
  std::optional<AttributeValue> Resolve(const std::string& element_name,
                                        const std::string& attribute_name) const;

 private:
  std::optional<AttributeValue> ResolvePatternElement(const std::string& pattern_element_id,
                                                      const std::string& attribute_name) const;
  std::optional<AttributeValue> ResolveMatched(const std::string& pattern_element_id,
                                               const std::string& attribute_name) const;
  std::optional<AttributeValue> ResolveModelByName(const std::string& element_name,
                                                   const std::string& attribute_name) const;
  std::optional<AttributeValue> ResolveFromLists(const std::string& element_name,
                                                 const std::string& attribute_name) const;

  const EvaluationContext& ctx_;
  // pattern element name -> id, the last element with a name wins
  std::unordered_map<std::string, std::string> name_index_;
};

std::optional<AttributeValue> ResolveReference(const std::string& element_name,
                                               const std::string& attribute_name,
                                               const EvaluationContext& ctx);

}  // namespace mtexpr
