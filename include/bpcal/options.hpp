#pragma once

#include <bpcal/config.h>

#include <cstddef>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

struct ParserOptions {
  /**
   * Number of polarizations listed per antenna on each data line. Every antenna contributes
   * one (amplitude, phase) pair per polarization.
   */
  std::size_t numPolarizations = 2;

  /**
   * Process every solution of a report instead of only the first one. Each solution results in
   * its own dataset.
   */
  bool allSolutions = false;

  /**
   * Treat more than one distinct time or field within a single solution as an error instead of
   * a warning.
   */
  bool strictMultiplicity = false;

  /**
   * Set the number of polarizations.
   *
   * @param[in] npol Number of polarizations. Must be larger than zero.
   */
  inline auto set_num_polarizations(std::size_t npol) -> ParserOptions& {
    numPolarizations = npol;
    return *this;
  }

  /**
   * Set processing of all solutions.
   *
   * @param[in] all True if every solution of a report should be processed.
   */
  inline auto set_all_solutions(bool all) -> ParserOptions& {
    allSolutions = all;
    return *this;
  }

  /**
   * Set strict handling of multiple times or fields.
   *
   * @param[in] strict True if multiple times or fields should be an error.
   */
  inline auto set_strict_multiplicity(bool strict) -> ParserOptions& {
    strictMultiplicity = strict;
    return *this;
  }
};

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */
