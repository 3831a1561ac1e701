#include "ToolParams.hpp"

#include <pugixml.hpp>
#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace thalweg {

namespace {

constexpr char Root[] = "Thalweg";

[[noreturn]] void Fail(const pugi::xml_node& node, gsl::czstring attrName,
                       const std::string& what)
{
  throw std::runtime_error{std::string{"attribute '"} + attrName + "' on <"
                           + node.name() + ">: " + what};
} // Fail

std::optional<std::string>
OptAttr(const pugi::xml_node& node, gsl::czstring attrName) {
  if (auto a = node.attribute(attrName); a && a.value()[0] != '\0')
    return std::string{a.value()};
  return std::nullopt;
} // OptAttr

std::string RequireAttr(const pugi::xml_node& node, gsl::czstring attrName) {
  if (auto v = OptAttr(node, attrName))
    return *v;
  Fail(node, attrName, "missing");
} // RequireAttr

class Reader {
public:
  Reader(const ParameterFile& file, fs::path baseDir)
    : _file{file}, _base{std::move(baseDir)} { }

  fs::path Path(const pugi::xml_node& node, gsl::czstring attrName) const {
    auto p = fs::path{RequireAttr(node, attrName)};
    return (p.is_relative() && !_base.empty()) ? _base / p : p;
  }

  Distance Length(const pugi::xml_node& node, gsl::czstring attrName,
                  std::optional<Distance> fallback = {}) const
    { return Parse(node, attrName, fallback, _file.linearUnit); }

  /// Elevation differences: a bare number is in z_unit.
  Distance Height(const pugi::xml_node& node, gsl::czstring attrName,
                  std::optional<Distance> fallback = {}) const
    { return Parse(node, attrName, fallback, _file.zUnit); }

  std::optional<Box> Extent(const pugi::xml_node& node) const {
    constexpr auto key = "extent";
    const auto text = OptAttr(node, key);
    if (!text)
      return std::nullopt;
    auto iss = std::istringstream{*text};
    auto lo = Pt{};
    auto hi = Pt{};
    if (!(iss >> lo.x >> lo.y >> hi.x >> hi.y) || !(lo.x < hi.x && lo.y < hi.y))
      Fail(node, key, "expected \"xmin ymin xmax ymax\"");
    return Box{lo, hi};
  }

  Distance Default(double value) const
    { return MakeDistance(value, _file.linearUnit); }

  Distance DefaultHeight(double value) const
    { return MakeDistance(value, _file.zUnit); }

private:
  Distance Parse(const pugi::xml_node& node, gsl::czstring attrName,
                 std::optional<Distance> fallback, LinearUnit defaultUnit) const
  {
    const auto text = OptAttr(node, attrName);
    if (!text) {
      if (fallback)
        return *fallback;
      Fail(node, attrName, "missing");
    }
    auto d = Distance{};
    try {
      d = ParseLength(*text, defaultUnit);
    }
    catch (const std::invalid_argument& e) {
      Fail(node, attrName, e.what());
    }
    if (!(d > Distance{}))
      Fail(node, attrName, "must be a positive length");
    return d;
  }

  const ParameterFile& _file;
  fs::path _base;
}; // Reader

CenterlineAdjusterParams ParseAdjuster(const pugi::xml_node& n, const Reader& r) {
  auto p = CenterlineAdjusterParams{};
  p.dem            = r.Path(n, "dem");
  p.streams        = r.Path(n, "streams");
  p.output         = r.Path(n, "output");
  p.extent         = r.Extent(n);
  p.searchDistance = r.Length(n, "search_distance");
  p.spacing        = r.Length(n, "spacing", r.Default(1.0));
  p.threshold      = r.Height(n, "threshold", r.DefaultHeight(0.2));
  return p;
} // ParseAdjuster

CrossSectionParams ParseCrossSections(const pugi::xml_node& n, const Reader& r) {
  const auto hundredFeet = MakeDistance(100.0, LinearUnit::FeetUS);
  auto p = CrossSectionParams{};
  p.streams  = r.Path(n, "streams");
  p.output   = r.Path(n, "output");
  p.extent   = r.Extent(n);
  p.width    = r.Length(n, "width", hundredFeet);
  p.interval = r.Length(n, "interval", hundredFeet);
  return p;
} // ParseCrossSections

LocalMinimumParams ParseLocalMinimums(const pugi::xml_node& n, const Reader& r) {
  auto p = LocalMinimumParams{};
  p.line      = r.Path(n, "line");
  p.dem       = r.Path(n, "dem");
  p.output    = r.Path(n, "output");
  p.extent    = r.Extent(n);
  p.interval  = r.Length(n, "interval", r.Default(1.0));
  p.threshold = r.Height(n, "threshold", MakeDistance(2.0, LinearUnit::Inches));
  return p;
} // ParseLocalMinimums

LinearUnit UnitAttr(const pugi::xml_node& node, gsl::czstring attrName) {
  const auto text = OptAttr(node, attrName);
  if (!text)
    return LinearUnit::Meters;
  try {
    return ParseLinearUnit(*text);
  }
  catch (const std::invalid_argument& e) {
    Fail(node, attrName, e.what());
  }
} // UnitAttr

} // anonymous

std::string_view ToolName(const ToolParams& tool) noexcept {
  return std::visit([](const auto& p) { return p.Tag; }, tool);
} // ToolName

ParameterFile ParseParameters(std::string_view xml, const fs::path& baseDir) {
  auto doc = pugi::xml_document{};
  const auto result = doc.load_buffer(xml.data(), xml.size());
  if (!result)
    throw std::runtime_error{std::string{"XML parse error: "} + result.description()};

  const auto root = doc.child(Root);
  if (!root)
    throw std::runtime_error{std::string{"root element <"} + Root + "> not found"};

  auto file = ParameterFile{};
  file.linearUnit = UnitAttr(root, "linear_unit");
  file.zUnit      = UnitAttr(root, "z_unit");

  const auto reader = Reader{file, baseDir};
  for (const auto& node : root.children()) {
    if (node.type() != pugi::node_element)
      continue;
    const auto name = std::string_view{node.name()};
    if (name == CenterlineAdjusterParams::Tag)
      file.tools.emplace_back(ParseAdjuster(node, reader));
    else if (name == CrossSectionParams::Tag)
      file.tools.emplace_back(ParseCrossSections(node, reader));
    else if (name == LocalMinimumParams::Tag)
      file.tools.emplace_back(ParseLocalMinimums(node, reader));
    else
      throw std::runtime_error{"unknown tool <" + std::string{name} + ">"};
  }
  return file;
} // ParseParameters

ParameterFile LoadParameters(const fs::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) throw std::runtime_error{"cannot open parameters: " + path.string()};
  auto buf = std::ostringstream{};
  buf << in.rdbuf();
  try {
    return ParseParameters(buf.str(), path.parent_path());
  }
  catch (const std::runtime_error& e) {
    throw std::runtime_error{path.string() + ": " + e.what()};
  }
} // LoadParameters

} // thalweg
