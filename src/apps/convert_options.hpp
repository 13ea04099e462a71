#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "bpcal/config.h"
#include "bpcal/options.hpp"

namespace bpcal {
namespace apps {

// parser settings given explicitly on the command line
struct CommandLineOptions {
  std::string configFileName;
  std::optional<std::size_t> numPolarizations;
  std::optional<bool> allSolutions;
  std::optional<bool> strictMultiplicity;
};

/*
 * Read parser options from a JSON file with the optional keys "num_polarizations",
 * "all_solutions" and "strict_multiplicity". Missing keys keep their default.
 * Throws FileError if the file cannot be read or holds invalid values.
 */
auto load_options(const std::string& fileName) -> ParserOptions;

// options of the config file, if any, overridden by explicit command line values
auto resolve_options(const CommandLineOptions& cmdOptions) -> ParserOptions;

// output file of solution k: the given name for k = 0, <stem>_sol<k><extension> otherwise
auto solution_file_name(const std::string& fileName, std::size_t index) -> std::string;

}  // namespace apps
}  // namespace bpcal
