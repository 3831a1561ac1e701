/// @file
/// Console messages: progress on std::cout, warnings on std::cerr.
#pragma once

#include <iostream>
#include <utility>

namespace thalweg {

template<typename... Args>
void Log(Args&&... args) {
  (std::cout << ... << std::forward<Args>(args)) << '\n';
}

template<typename... Args>
void Warn(Args&&... args) {
  std::cerr << "warning: ";
  (std::cerr << ... << std::forward<Args>(args)) << std::endl;
}

} // thalweg
