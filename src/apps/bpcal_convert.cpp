#include <CLI/CLI.hpp>
#include <cstddef>
#include <iostream>
#include <string>

#include "apps/convert_options.hpp"
#include "bpcal/bpcal.hpp"

int main(int argc, char** argv) {
  std::string reportFileName, outputFileName, configFileName, plotFileName;
  std::size_t npol = 2;
  std::size_t pol = 0;
  bool allSolutions = false;
  bool strict = false;
  bool inspect = false;

  CLI::App app{"bpcal bandpass report conversion"};
  app.add_option("-r,--report", reportFileName, "Bandpass report text file")->required();
  app.add_option("-o,--output", outputFileName, "Output HDF5 file name")->required();
  app.add_option("-c,--config", configFileName, "JSON parser options file");
  auto npolOpt = app.add_option("--npol", npol, "Number of polarizations");
  auto allOpt = app.add_flag("--all-solutions", allSolutions, "Convert every solution");
  auto strictOpt =
      app.add_flag("--strict", strict, "Fail on multiple times or fields in a solution");
  app.add_option("--plot", plotFileName,
                 "Output plot image, SVG or raster format chosen by file extension");
  app.add_option("--pol", pol, "Polarization index to plot")->default_val(0);
  app.add_flag("--inspect", inspect, "List the content of the written file");
  CLI11_PARSE(app, argc, argv);

  try {
    bpcal::apps::CommandLineOptions cmdOptions;
    cmdOptions.configFileName = configFileName;
    if (npolOpt->count()) cmdOptions.numPolarizations = npol;
    if (allOpt->count()) cmdOptions.allSolutions = allSolutions;
    if (strictOpt->count()) cmdOptions.strictMultiplicity = strict;
    const auto opt = bpcal::apps::resolve_options(cmdOptions);

    const auto result = bpcal::parse_bandpass_report_file(reportFileName, opt);

    for (const auto& d : result.diagnostics) {
      std::cerr << "Warning (" << bpcal::to_string(d.kind) << "): " << d.message << std::endl;
    }

    for (std::size_t i = 0; i < result.datasets.size(); ++i) {
      const auto fileName = bpcal::apps::solution_file_name(outputFileName, i);
      bpcal::BandpassFile::create(fileName, result.datasets[i]);
      std::cout << "Saved: " << fileName << std::endl;

      if (inspect) {
        const auto summary = bpcal::inspect_bandpass_file(fileName);
        std::cout << "Groups in HDF5 file:" << std::endl;
        for (const auto& g : summary.groups) std::cout << " - " << g << std::endl;
        std::cout << std::endl << "Datasets in BANDPASS group:" << std::endl;
        for (const auto& m : summary.members) std::cout << " - " << m << std::endl;
      }
    }

    if (!plotFileName.empty() && !result.datasets.empty()) {
      bpcal::plot_bandpass(outputFileName, plotFileName, pol);
      std::cout << "Plot: " << plotFileName << std::endl;
    }
  } catch (const bpcal::GenericError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
