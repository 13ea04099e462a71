#pragma once

#include <bpcal/config.h>

enum BpcalError {
  /**
   * Success. No error.
   */
  BPCAL_SUCCESS,
  /**
   * Unknown error.
   */
  BPCAL_UNKNOWN_ERROR,
  /**
   * Generic error.
   */
  BPCAL_GENERIC_ERROR,
  /**
   * Internal error.
   */
  BPCAL_INTERNAL_ERROR,
  /**
   * Invalid parameter error.
   */
  BPCAL_INVALID_PARAMETER_ERROR,
  /**
   * HDF5 error.
   */
  BPCAL_HDF5_ERROR,
  /**
   * File error.
   */
  BPCAL_FILE_ERROR,
  /**
   * Report without solution or section markers.
   */
  BPCAL_MALFORMED_REPORT_ERROR,
  /**
   * Table sections with different number of rows.
   */
  BPCAL_SECTION_ALIGNMENT_ERROR,
  /**
   * Data line with unexpected number of values.
   */
  BPCAL_RECORD_SHAPE_ERROR,
  /**
   * More than one time or field in a single solution.
   */
  BPCAL_MULTIPLICITY_ERROR
};

