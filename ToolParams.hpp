/// @file
/// Tool parameters read from an XML parameter file:
///
///   <Thalweg linear_unit="Meters" z_unit="Meters">
///     <StreamCenterlineAdjuster dem="dem.tif" streams="in.xy" output="out.xy"
///         search_distance="10 Meters" spacing="1" threshold="0.2 Meters"/>
///     <GenerateCrossSections streams="in.xy" output="xs.xy"
///         width="100 FeetUS" interval="100 FeetUS"/>
///     <LocalMinimums line="in.xy" dem="dem.tif" output="min.xy"
///         interval="1" threshold="2 Inches"/>
///   </Thalweg>
///
/// Lengths are "<number> [unit]"; a bare number is in linear_unit, or in
/// z_unit for the elevation thresholds.  Every tool accepts
/// extent="xmin ymin xmax ymax".  Relative paths are relative to the
/// parameter file.
#pragma once

#include "Geometry.hpp"
#include "Units.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace thalweg {

struct CenterlineAdjusterParams {
  static constexpr std::string_view Tag = "StreamCenterlineAdjuster";
  std::filesystem::path dem;
  std::filesystem::path streams;
  std::filesystem::path output;
  std::optional<Box> extent;
  Distance searchDistance;
  Distance spacing;     ///< default 1 linear unit
  Distance threshold;   ///< default 0.2 z units
}; // CenterlineAdjusterParams

struct CrossSectionParams {
  static constexpr std::string_view Tag = "GenerateCrossSections";
  std::filesystem::path streams;
  std::filesystem::path output;
  std::optional<Box> extent;
  Distance width;       ///< default 100 FeetUS
  Distance interval;    ///< default 100 FeetUS
}; // CrossSectionParams

struct LocalMinimumParams {
  static constexpr std::string_view Tag = "LocalMinimums";
  std::filesystem::path line;
  std::filesystem::path dem;
  std::filesystem::path output;
  std::optional<Box> extent;
  Distance interval;    ///< default 1 linear unit
  Distance threshold;   ///< default 2 Inches
}; // LocalMinimumParams

using ToolParams =
    std::variant<CenterlineAdjusterParams, CrossSectionParams, LocalMinimumParams>;

struct ParameterFile {
  LinearUnit linearUnit = LinearUnit::Meters;
  LinearUnit zUnit      = LinearUnit::Meters;
  std::vector<ToolParams> tools;
}; // ParameterFile

std::string_view ToolName(const ToolParams& tool) noexcept;

/// baseDir resolves relative paths.  Throws std::runtime_error naming the
/// element and attribute on any missing or malformed value.
ParameterFile ParseParameters(std::string_view xml,
                              const std::filesystem::path& baseDir = {});
ParameterFile LoadParameters(const std::filesystem::path& path);

} // thalweg
