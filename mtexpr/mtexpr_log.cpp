// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/mtexpr_log.h"
#include <atomic>
#include <memory>
#include <utility>
#include "spdlog/spdlog.h"

namespace mtexpr {
// read and replaced with std::atomic_load/atomic_store only
static std::shared_ptr<Logger> g_logger;
std::shared_ptr<Logger> Logger::GetMtexprLogger() {
  std::shared_ptr<Logger> logger = std::atomic_load(&g_logger);
  if (logger) {
    return logger;
  }
  static std::shared_ptr<Logger> default_logger = std::make_shared<Spdlogger>();
  return default_logger;
}
void Logger::SetLogger(std::shared_ptr<Logger> logger) {
  std::atomic_store(&g_logger, std::move(logger));
}

Spdlogger::Spdlogger() {}
bool Spdlogger::ShouldLog(spdlog::level::level_enum log_level) {
  auto logger = spdlog::default_logger_raw();
  if (nullptr == logger) {
    return false;
  }
  return logger->should_log(log_level);
}
void Spdlogger::Log(spdlog::source_loc loc, spdlog::level::level_enum lvl, std::string_view msg) {
  auto logger = spdlog::default_logger_raw();
  if (nullptr == logger) {
    return;
  }
  logger->log(loc, lvl, msg);
}
}  // namespace mtexpr
