#pragma once

#include <bpcal/config.h>

enum BpcalLogLevel {
  BPCAL_LOG_LEVEL_OFF,
  BPCAL_LOG_LEVEL_ERROR,
  BPCAL_LOG_LEVEL_WARN,
  BPCAL_LOG_LEVEL_INFO,
  BPCAL_LOG_LEVEL_DEBUG,
};

