// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once
#include <fmt/core.h>
#include <stdio.h>
#include <memory>
#include <string>
#include <string_view>
#include "spdlog/logger.h"

#include "fmt/ostream.h"  // do NOT put this line before spdlog

namespace mtexpr {

class Logger {
 public:
  virtual bool ShouldLog(spdlog::level::level_enum log_level) = 0;
  virtual void Log(spdlog::source_loc loc, spdlog::level::level_enum lvl, std::string_view msg) = 0;
  // Both may be called from any thread, a swapped out logger lives until its last caller returns.
  static std::shared_ptr<Logger> GetMtexprLogger();
  static void SetLogger(std::shared_ptr<Logger> logger);
  virtual ~Logger() {}
};

class Spdlogger : public Logger {
 public:
  Spdlogger();
  virtual bool ShouldLog(spdlog::level::level_enum log_level);
  virtual void Log(spdlog::source_loc loc, spdlog::level::level_enum lvl, std::string_view msg);
};

}  // namespace mtexpr

#define MTEXPR_LOG(lvl, ...)                                                                 \
  do {                                                                                       \
    std::shared_ptr<mtexpr::Logger> mtexpr_logger = mtexpr::Logger::GetMtexprLogger();       \
    if (mtexpr_logger->ShouldLog(lvl)) {                                                     \
      std::string s = fmt::format(__VA_ARGS__);                                              \
      mtexpr_logger->Log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, lvl, s); \
    }                                                                                        \
  } while (0)

#define MTEXPR_ERROR(...) MTEXPR_LOG(spdlog::level::err, __VA_ARGS__)
#define MTEXPR_WARN(...) MTEXPR_LOG(spdlog::level::warn, __VA_ARGS__)
#define MTEXPR_INFO(...) MTEXPR_LOG(spdlog::level::info, __VA_ARGS__)
#define MTEXPR_DEBUG(...) MTEXPR_LOG(spdlog::level::debug, __VA_ARGS__)
