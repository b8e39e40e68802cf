#pragma once
#include <string>

namespace hostwatch::util {

// Build a retro-styled usage bar: " ████░░░░ ".
// pct in 0..100, width is the number of cells between the padding spaces.
auto retro_bar(double pct, int width = 20, const std::string& fill = "█", const std::string& track = "░") -> std::string;

} // namespace hostwatch::util
