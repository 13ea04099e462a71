#pragma once

#include <bpcal/config.h>
#include <bpcal/enums.h>
#include <bpcal/errors.h>

#include <bpcal/bandpass_file.hpp>
#include <bpcal/bandpass_report.hpp>
#include <bpcal/calibration_dataset.hpp>
#include <bpcal/diagnostics.hpp>
#include <bpcal/exceptions.hpp>
#include <bpcal/options.hpp>
#include <bpcal/plot.hpp>
