/// @file
/// The toolbox: each tool reads its inputs, runs, and writes its output.
#pragma once

#include "ToolParams.hpp"

namespace thalweg {

void Run(const CenterlineAdjusterParams& params, const ParameterFile& file);
void Run(const CrossSectionParams& params, const ParameterFile& file);
void Run(const LocalMinimumParams& params, const ParameterFile& file);

void Run(const ToolParams& tool, const ParameterFile& file);

} // thalweg
