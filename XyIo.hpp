/// @file
/// Plain-text coordinate files: one "x y" pair per line.  In line files a
/// "# reach" line starts a new reach; any other '#' line is a comment.
#pragma once

#include "Geometry.hpp"

#include <filesystem>
#include <iosfwd>

namespace thalweg {

std::ostream& operator<<(std::ostream& os, const Pt& p);
std::istream& operator>>(std::istream& is, Pt& p);

Polyline ReadPolyline(std::istream& in);
Polyline ReadPolyline(const std::filesystem::path& path);

void WritePolyline(std::ostream& out, const Polyline& lines);
void WritePolyline(const std::filesystem::path& path, const Polyline& lines);

void WritePoints(const std::filesystem::path& path, const Points& pts);

} // thalweg
