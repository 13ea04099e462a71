#include "apps/convert_options.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "bpcal/exceptions.hpp"

namespace bpcal {
namespace apps {

auto load_options(const std::string& fileName) -> ParserOptions {
  std::ifstream jsonFile(fileName);
  if (!jsonFile) {
    throw FileError("Failed to open options file \"" + fileName + "\".");
  }

  ParserOptions opt;
  try {
    nlohmann::json j;
    jsonFile >> j;

    if (j.contains("num_polarizations"))
      opt.set_num_polarizations(j.at("num_polarizations").get<std::size_t>());
    if (j.contains("all_solutions")) opt.set_all_solutions(j.at("all_solutions").get<bool>());
    if (j.contains("strict_multiplicity"))
      opt.set_strict_multiplicity(j.at("strict_multiplicity").get<bool>());
  } catch (const nlohmann::json::exception& e) {
    throw FileError("JSON input error in \"" + fileName + "\": " + e.what());
  }

  return opt;
}

auto resolve_options(const CommandLineOptions& cmdOptions) -> ParserOptions {
  auto opt = cmdOptions.configFileName.empty() ? ParserOptions()
                                               : load_options(cmdOptions.configFileName);

  if (cmdOptions.numPolarizations) opt.set_num_polarizations(*cmdOptions.numPolarizations);
  if (cmdOptions.allSolutions) opt.set_all_solutions(*cmdOptions.allSolutions);
  if (cmdOptions.strictMultiplicity) opt.set_strict_multiplicity(*cmdOptions.strictMultiplicity);

  return opt;
}

auto solution_file_name(const std::string& fileName, std::size_t index) -> std::string {
  if (index == 0) return fileName;
  std::filesystem::path path(fileName);
  auto name = path.stem().string() + "_sol" + std::to_string(index) + path.extension().string();
  return (path.parent_path() / name).string();
}

}  // namespace apps
}  // namespace bpcal
