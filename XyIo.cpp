#include "XyIo.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace thalweg {

namespace {

constexpr std::string_view ReachMarker = "# reach";

std::ofstream OpenOutput(const fs::path& path) {
  auto out = std::ofstream{path, std::ios::binary};
  if (!out) throw std::runtime_error{"cannot open output: " + path.string()};
  out.exceptions(std::ios::failbit|std::ios::badbit);
  out << std::fixed << std::setprecision(3);
  return out;
} // OpenOutput

} // anonymous

std::ostream& operator<<(std::ostream& os, const Pt& p)
  { return os << p.x << ' ' << p.y; }

std::istream& operator>>(std::istream& is, Pt& p)
  { return is >> p.x >> p.y; }

Polyline ReadPolyline(std::istream& in) {
  auto lines = Polyline{};
  auto* reach = static_cast<Reach*>(nullptr);
  auto text = std::string{};
  auto lineNo = 0;
  while (getline(in, text)) {
    ++lineNo;
    if (!text.empty() && text.back() == '\r')
      text.pop_back();
    if (text.find_first_not_of(" \t") == std::string::npos)
      continue;
    if (text.starts_with('#')) {
      if (text.starts_with(ReachMarker))
        reach = &lines.emplace_back();
      continue;
    }
    if (reach == nullptr)
      reach = &lines.emplace_back();
    auto iss = std::istringstream{text};
    auto pt = Pt{};
    if (!(iss >> pt))
      throw std::runtime_error{"line " + std::to_string(lineNo)
                               + ": expected \"x y\", got \"" + text + '"'};
    reach->push_back(pt);
  }
  std::erase_if(lines, [](const Reach& r) { return r.empty(); });
  return lines;
} // ReadPolyline

Polyline ReadPolyline(const fs::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) throw std::runtime_error{"cannot open input: " + path.string()};
  try {
    return ReadPolyline(in);
  }
  catch (const std::runtime_error& e) {
    throw std::runtime_error{path.string() + ": " + e.what()};
  }
} // ReadPolyline

void WritePolyline(std::ostream& out, const Polyline& lines) {
  for (const auto& reach : lines) {
    out << ReachMarker << '\n';
    for (const auto& p : reach)
      out << p << '\n';
  }
} // WritePolyline

void WritePolyline(const fs::path& path, const Polyline& lines) {
  auto out = OpenOutput(path);
  WritePolyline(out, lines);
  out.close();
} // WritePolyline

void WritePoints(const fs::path& path, const Points& pts) {
  auto out = OpenOutput(path);
  for (const auto& p : pts)
    out << p << '\n';
  out.close();
} // WritePoints

} // thalweg
