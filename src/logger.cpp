#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

#include <spdlog/common.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace bpcal {
namespace {

struct ArrayInfo {
  ArrayInfo(std::size_t n, const std::complex<double>* data) : n(n) {
    min = {std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    max = {-std::numeric_limits<double>::max(), -std::numeric_limits<double>::max()};

    for (std::size_t i = 0; i < n; ++i) {
      const auto& val = data[i];
      min = {std::min(min.real(), val.real()), std::min(min.imag(), val.imag())};
      max = {std::max(max.real(), val.real()), std::max(max.imag(), val.imag())};

      sum += val;

      const auto fpReal = std::fpclassify(val.real());
      const auto fpImag = std::fpclassify(val.imag());

      normal |= (fpReal == FP_NORMAL) | (fpImag == FP_NORMAL);
      subnormal |= (fpReal == FP_SUBNORMAL) | (fpImag == FP_SUBNORMAL);
      inf |= (fpReal == FP_INFINITE) | (fpImag == FP_INFINITE);
      nan |= (fpReal == FP_NAN) | (fpImag == FP_NAN);
      zero |= (fpReal == FP_ZERO) | (fpImag == FP_ZERO);
    }
  }

  std::size_t n;
  std::complex<double> min, max, sum;
  bool normal = false, subnormal = false, inf = false, nan = false, zero = false;
};

auto log_array_info(spdlog::level::level_enum lvl, spdlog::logger& log, std::string_view s,
                    std::size_t n, const std::complex<double>* array) -> void {
  std::string logString;

  logString += "array \"" + std::string(s) + "\": ";

  if (n == 0) {
    logString += "size {}";
    log.log(lvl, fmt::runtime(logString), n);
    return;
  }

  logString += "size {}, min ({}, {}), max ({}, {}), sum ({}, {})";

  ArrayInfo info(n, array);

  logString += ", fp classes [";

  if (info.normal) logString += "normal,";
  if (info.zero) logString += "zero,";
  if (info.subnormal) logString += "subnormal,";
  if (info.inf) logString += "inf,";
  if (info.nan) logString += "nan,";

  if (logString.back() == ',') logString.pop_back();
  logString += "]";

  log.log(lvl, fmt::runtime(logString), info.n, info.min.real(), info.min.imag(),
          info.max.real(), info.max.imag(), info.sum.real(), info.sum.imag());
}

}  // namespace

Logger::Logger() {
  // Set initial log level if environment variable is set
  if (const char* envLog = std::getenv("BPCAL_LOG_LEVEL")) {
    if (!std::strcmp(envLog, "off") || !std::strcmp(envLog, "OFF"))
      level_ = BPCAL_LOG_LEVEL_OFF;
    else if (!std::strcmp(envLog, "debug") || !std::strcmp(envLog, "DEBUG"))
      level_ = BPCAL_LOG_LEVEL_DEBUG;
    else if (!std::strcmp(envLog, "info") || !std::strcmp(envLog, "INFO"))
      level_ = BPCAL_LOG_LEVEL_INFO;
    else if (!std::strcmp(envLog, "warn") || !std::strcmp(envLog, "WARN"))
      level_ = BPCAL_LOG_LEVEL_WARN;
    else if (!std::strcmp(envLog, "error") || !std::strcmp(envLog, "ERROR"))
      level_ = BPCAL_LOG_LEVEL_ERROR;
  }

  const char* logOut = "stdout";
  if (const char* logOutEnv = std::getenv("BPCAL_LOG_OUT")) {
    logOut = logOutEnv;
  }

  create_logger(logOut);
}

auto Logger::create_logger(const char* out) -> void {
  spdlog::set_automatic_registration(false);
  if (!std::strcmp(out, "stderr")) {
    logger_ = spdlog::stderr_logger_st("bpcal");
  } else {
    logger_ = spdlog::stdout_logger_st("bpcal");
  }
  // filtering is done by level_
  logger_->set_level(spdlog::level::trace);
}

auto Logger::convert_level(BpcalLogLevel l) -> spdlog::level::level_enum {
  switch (l) {
    case BpcalLogLevel::BPCAL_LOG_LEVEL_OFF:
      return spdlog::level::off;
    case BpcalLogLevel::BPCAL_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case BpcalLogLevel::BPCAL_LOG_LEVEL_WARN:
      return spdlog::level::warn;
    case BpcalLogLevel::BPCAL_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case BpcalLogLevel::BPCAL_LOG_LEVEL_DEBUG:
      return spdlog::level::debug;
  }

  return spdlog::level::debug;
}

auto Logger::log_array(BpcalLogLevel level, std::string_view s, std::size_t n,
                       const std::complex<double>* array) -> void {
  if (level <= level_ && logger_) {
    log_array_info(convert_level(level), *logger_, s, n, array);
  }
}

Logger globLogger;

}  // namespace bpcal
