#include "Tools.hpp"
#include "CenterlineAdjuster.hpp"
#include "Dem.hpp"
#include "LocalMinimums.hpp"
#include "Log.hpp"
#include "Polyline.hpp"
#include "Transect.hpp"
#include "XyIo.hpp"

#include <filesystem>
#include <variant>

namespace fs = std::filesystem;

namespace thalweg {

namespace {

Dem LoadCheckedDem(const fs::path& path, const ParameterFile& file) {
  auto dem = LoadDem(path);
  if (dem.linearUnit && *dem.linearUnit != file.linearUnit) {
    Warn(path.string(), " is in ", Name(*dem.linearUnit),
         " but linear_unit is ", Name(file.linearUnit));
  }
  return dem;
} // LoadCheckedDem

Polyline ReadLines(const fs::path& path, const std::optional<Box>& extent) {
  auto lines = ReadPolyline(path);
  if (extent) {
    Log("clipping ", path.string(), " to analysis area");
    lines = ClipToExtent(lines, *extent);
  }
  Log("read ", lines.size(), " reaches from ", path.string());
  return lines;
} // ReadLines

} // anonymous

void Run(const CenterlineAdjusterParams& params, const ParameterFile& file) {
  auto options = RelaxOptions{};
  options.searchDistance = ToUnits(params.searchDistance, file.linearUnit);
  options.spacing        = ToUnits(params.spacing, file.linearUnit);
  options.threshold      = ToUnits(params.threshold, file.zUnit);

  const auto dem   = LoadCheckedDem(params.dem, file);
  const auto lines = ReadLines(params.streams, params.extent);

  Log("optimizing stream line");
  const auto relaxed = RelaxPolyline(lines, dem.surface, options);

  Log("writing ", params.output.string());
  WritePolyline(params.output, relaxed);
} // Run (CenterlineAdjusterParams)

void Run(const CrossSectionParams& params, const ParameterFile& file) {
  const auto width    = ToUnits(params.width, file.linearUnit);
  const auto interval = ToUnits(params.interval, file.linearUnit);
  const auto lines    = ReadLines(params.streams, params.extent);

  Log("generating transects");
  auto sections = Polyline{};
  for (const auto& reach : lines) {
    try {
      for (const auto& t : GenerateCrossSections(ArcLine{reach}, interval, width))
        sections.push_back(Reach{t.first, t.second});
    }
    catch (const DegenerateGeometryError& e) {
      Warn("reach skipped: ", e.what());
    }
  }
  Log("writing ", sections.size(), " cross-sections to ", params.output.string());
  WritePolyline(params.output, sections);
} // Run (CrossSectionParams)

void Run(const LocalMinimumParams& params, const ParameterFile& file) {
  const auto interval  = ToUnits(params.interval, file.linearUnit);
  const auto threshold = ToUnits(params.threshold, file.zUnit);

  const auto dem   = LoadCheckedDem(params.dem, file);
  const auto lines = ReadLines(params.line, params.extent);

  Log("finding local minimums");
  const auto minimums = FindLocalMinimums(lines, dem.surface, interval, threshold);
  if (minimums.empty()) {
    Log("no local minimums found");
    return;
  }
  Log("writing ", minimums.size(), " minimums to ", params.output.string());
  WritePoints(params.output, minimums);
} // Run (LocalMinimumParams)

void Run(const ToolParams& tool, const ParameterFile& file) {
  Log("running ", ToolName(tool));
  std::visit([&](const auto& params) { Run(params, file); }, tool);
} // Run (ToolParams)

} // thalweg
