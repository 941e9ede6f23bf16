// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <stdint.h>
#include <string>
#include "kcfg_json.h"
#include "mtexpr/script_sandbox.h"

namespace mtexpr {

struct EngineOptions {
  int64_t script_timeout_ms = 1000;
  int script_memory_limit_mb = 64;
  int script_stack_size_kb = 512;
  int max_expression_depth = 32;
  // trace/debug/info/warn/error/critical/off
  std::string log_level = "info";
  bool trace_sandbox_bindings = false;

  KCFG_DEFINE_FIELDS(script_timeout_ms, script_memory_limit_mb, script_stack_size_kb,
                     max_expression_depth, log_level, trace_sandbox_bindings)

  ScriptLimits Limits() const;
  // MTEXPR_OK, or MTEXPR_ERR_INVALID_OPTIONS for non positive limits or an unknown level.
  int Validate() const;
};

// Fields missing from the JSON keep their defaults.
int LoadOptionsFromJson(const std::string& content, EngineOptions& options);
int LoadOptionsFromFile(const std::string& file, EngineOptions& options);
std::string OptionsToJson(const EngineOptions& options);

// Sets the level of the spdlog default logger.
int ApplyLogLevel(const std::string& level);

}  // namespace mtexpr
