// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/mtexpr_options.h"
#include "mtexpr/mtexpr_err.h"
#include "mtexpr/mtexpr_log.h"
#include "spdlog/spdlog.h"

namespace mtexpr {

static bool ParseLevel(const std::string& level, spdlog::level::level_enum& lvl) {
  lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  return lvl != spdlog::level::off || level == "off";
}

ScriptLimits EngineOptions::Limits() const {
  ScriptLimits limits;
  limits.timeout_ms = script_timeout_ms;
  limits.memory_limit = static_cast<int64_t>(script_memory_limit_mb) * 1024 * 1024;
  limits.max_stack_size = static_cast<int64_t>(script_stack_size_kb) * 1024;
  return limits;
}

int EngineOptions::Validate() const {
  if (script_timeout_ms <= 0 || script_memory_limit_mb <= 0 || script_stack_size_kb <= 0 ||
      max_expression_depth <= 0) {
    MTEXPR_ERROR(
        "Invalid engine limits: timeout_ms={}, memory_limit_mb={}, stack_size_kb={}, "
        "expression_depth={}",
        script_timeout_ms, script_memory_limit_mb, script_stack_size_kb, max_expression_depth);
    return MTEXPR_ERR_INVALID_OPTIONS;
  }
  spdlog::level::level_enum lvl;
  if (!ParseLevel(log_level, lvl)) {
    MTEXPR_ERROR("Invalid log level '{}'", log_level);
    return MTEXPR_ERR_INVALID_OPTIONS;
  }
  return MTEXPR_OK;
}

int LoadOptionsFromJson(const std::string& content, EngineOptions& options) {
  if (!kcfg::ParseFromJsonString(content, options)) {
    MTEXPR_ERROR("Failed to parse engine options json");
    return MTEXPR_ERR_INVALID_JSON;
  }
  return options.Validate();
}

int LoadOptionsFromFile(const std::string& file, EngineOptions& options) {
  if (!kcfg::ParseFromJsonFile(file, options)) {
    MTEXPR_ERROR("Failed to parse engine options file:{}", file);
    return MTEXPR_ERR_INVALID_JSON;
  }
  return options.Validate();
}

std::string OptionsToJson(const EngineOptions& options) {
  std::string s;
  kcfg::WriteToJsonString(options, s);
  return s;
}

int ApplyLogLevel(const std::string& level) {
  spdlog::level::level_enum lvl;
  if (!ParseLevel(level, lvl)) {
    MTEXPR_ERROR("Invalid log level '{}'", level);
    return MTEXPR_ERR_INVALID_OPTIONS;
  }
  spdlog::set_level(lvl);
  return MTEXPR_OK;
}

}  // namespace mtexpr
