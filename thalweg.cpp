/// @file
/// Runs the tools listed in a parameter file.
///
/// Usage:
///   thalweg <params.xml> [tool...]
///
/// With tool names (e.g. GenerateCrossSections) only those tools run.

#include "ToolParams.hpp"
#include "Tools.hpp"

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

int main(int argc, gsl::czstring argv[]) {
  try {
    auto arg0 = fs::path{argv[0]};

    if (argc < 2) {
      std::cerr << "usage:\n  " << arg0.filename().string()
        << " <params.xml> [tool...]\n";
      return EXIT_FAILURE;
    }

    const auto params = thalweg::LoadParameters(fs::path{argv[1]});
    const auto wanted = std::vector<std::string_view>(argv + 2, argv + argc);

    auto ran = 0;
    for (const auto& tool : params.tools) {
      const auto name = thalweg::ToolName(tool);
      if (!wanted.empty()
          && std::find(wanted.begin(), wanted.end(), name) == wanted.end())
        continue;
      thalweg::Run(tool, params);
      ++ran;
    }
    if (ran == 0)
      std::cerr << "no matching tools in " << argv[1] << '\n';
  }
  catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
} // main
