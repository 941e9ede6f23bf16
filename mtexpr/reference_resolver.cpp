// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/reference_resolver.h"
#include "mtexpr/mtexpr_log.h"

namespace mtexpr {

static std::optional<AttributeValue> FromValue(const Value* v) {
  if (nullptr == v) {
    return std::nullopt;
  }
  return AttributeValue(*v);
}

// style (canonical or legacy key) first, then the element's own properties
static std::optional<AttributeValue> ReadModelElement(const ModelElement& element,
                                                      const std::string& attribute_name) {
  if (auto v = FindAttribute(element.style, attribute_name)) {
    return AttributeValue(*v);
  }
  if (auto p = element.GetProperty(attribute_name)) {
    return AttributeValue(*p);
  }
  return std::nullopt;
}

ReferenceResolver::ReferenceResolver(const EvaluationContext& ctx) : ctx_(ctx) {
  if (nullptr != ctx_.pattern_elements) {
    for (const auto& [id, element] : *ctx_.pattern_elements) {
      if (!element.name.empty()) {
        name_index_[element.name] = id;
      }
    }
  }
}

std::optional<AttributeValue> ReferenceResolver::ResolvePatternElement(
    const std::string& pattern_element_id, const std::string& attribute_name) const {
  auto found = ctx_.pattern_elements->find(pattern_element_id);
  if (found == ctx_.pattern_elements->end()) {
    return std::nullopt;
  }
  if (auto v = FindAttribute(found->second.attributes, attribute_name)) {
    MTEXPR_DEBUG("Found attribute {} in pattern element {}", attribute_name, pattern_element_id);
    return *v;
  }
  return std::nullopt;
}

std::optional<AttributeValue> ReferenceResolver::ResolveMatched(
    const std::string& pattern_element_id, const std::string& attribute_name) const {
  auto matched = ctx_.pattern_match->matches.find(pattern_element_id);
  if (matched == ctx_.pattern_match->matches.end() || matched->second.empty()) {
    return std::nullopt;
  }
  const ModelElementMap& elements = *ctx_.model_elements;
  auto found = elements.find(matched->second);
  if (found == elements.end()) {
    // rule-time views key model elements by pattern element id
    found = elements.find(pattern_element_id);
  }
  if (found == elements.end()) {
    return std::nullopt;
  }
  MTEXPR_DEBUG("Found model element via pattern mapping: {} -> {}", pattern_element_id,
               matched->second);
  return ReadModelElement(found->second, attribute_name);
}

std::optional<AttributeValue> ReferenceResolver::ResolveModelByName(
    const std::string& element_name, const std::string& attribute_name) const {
  for (const auto& [id, element] : *ctx_.model_elements) {
    if (AttributeNameIs(element.style, "name", element_name)) {
      if (auto v = FromValue(FindAttribute(element.style, attribute_name))) {
        MTEXPR_DEBUG("Found model element by style.name: {} -> {}", element_name, id);
        return v;
      }
    }
    if (AttributeNameIs(element.attributes, "name", element_name)) {
      if (auto v = FromValue(FindAttribute(element.attributes, attribute_name))) {
        MTEXPR_DEBUG("Found model element by attributes.name: {} -> {}", element_name, id);
        return v;
      }
    }
  }
  return std::nullopt;
}

std::optional<AttributeValue> ReferenceResolver::ResolveFromLists(
    const std::string& element_name, const std::string& attribute_name) const {
  if (nullptr != ctx_.all_pattern_elements) {
    for (const auto& element : *ctx_.all_pattern_elements) {
      if (element.name != element_name) {
        continue;
      }
      if (auto v = FindAttribute(element.attributes, attribute_name)) {
        return *v;
      }
      break;
    }
  }
  if (nullptr != ctx_.all_model_elements) {
    for (const auto& element : *ctx_.all_model_elements) {
      bool named = (element.name && *element.name == element_name) ||
                   AttributeNameIs(element.style, "name", element_name) ||
                   AttributeNameIs(element.attributes, "name", element_name);
      if (!named) {
        continue;
      }
      if (auto v = FromValue(FindAttribute(element.style, attribute_name))) {
        return v;
      }
      if (auto v = FromValue(FindAttribute(element.attributes, attribute_name))) {
        return v;
      }
      if (auto p = element.GetProperty(attribute_name)) {
        return AttributeValue(*p);
      }
      break;
    }
  }
  return std::nullopt;
}

std::optional<AttributeValue> ReferenceResolver::Resolve(const std::string& element_name,
                                                         const std::string& attribute_name) const {
  std::string pattern_element_id;
  auto indexed = name_index_.find(element_name);
  if (indexed != name_index_.end()) {
    pattern_element_id = indexed->second;
    if (auto v = ResolvePatternElement(pattern_element_id, attribute_name)) {
      return v;
    }
  }
  if (nullptr != ctx_.pattern_match && nullptr != ctx_.model_elements &&
      !pattern_element_id.empty()) {
    if (auto v = ResolveMatched(pattern_element_id, attribute_name)) {
      return v;
    }
  }
  if (nullptr != ctx_.model_elements) {
    if (auto v = ResolveModelByName(element_name, attribute_name)) {
      return v;
    }
  }
  if (nullptr != ctx_.pattern_match && nullptr != ctx_.model_elements) {
    if (auto v = ResolveMatched(element_name, attribute_name)) {
      return v;
    }
  }
  return ResolveFromLists(element_name, attribute_name);
}

std::optional<AttributeValue> ResolveReference(const std::string& element_name,
                                               const std::string& attribute_name,
                                               const EvaluationContext& ctx) {
  ReferenceResolver resolver(ctx);
  return resolver.Resolve(element_name, attribute_name);
}

}  // namespace mtexpr
