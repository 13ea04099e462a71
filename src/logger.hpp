#pragma once

#include <complex>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "bpcal/config.h"
#include "bpcal/enums.h"

#include <fmt/core.h>
#include <spdlog/logger.h>

namespace bpcal {

class Logger {
public:
  // Level and output are taken from BPCAL_LOG_LEVEL and BPCAL_LOG_OUT
  Logger();

  Logger(const Logger&) = delete;

  Logger(Logger&&) = default;

  auto operator=(const Logger&) -> Logger& = delete;

  auto operator=(Logger&&) -> Logger& = default;

  template <typename... Args>
  auto log(BpcalLogLevel level, std::string_view s, Args&&... args) -> void {
    if (level <= level_ && logger_)
      logger_->log(convert_level(level), fmt::runtime(s), std::forward<Args>(args)...);
  }

  // log summary of a complex array
  auto log_array(BpcalLogLevel level, std::string_view s, std::size_t n,
                 const std::complex<double>* array) -> void;

private:
  static auto convert_level(BpcalLogLevel l) -> spdlog::level::level_enum;

  auto create_logger(const char* out) -> void;

  BpcalLogLevel level_ = BPCAL_LOG_LEVEL_WARN;
  std::shared_ptr<spdlog::logger> logger_;
};

extern Logger globLogger;

}  // namespace bpcal
