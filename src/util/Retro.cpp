#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>

namespace hostwatch::util {

auto retro_bar(double pct, int width, const std::string& fill, const std::string& track) -> std::string {
  if (width <= 0) return " ";
  if (std::isnan(pct)) pct = 0.0;
  pct = std::clamp(pct, 0.0, 100.0);
  int filled = std::min(width, static_cast<int>(std::lround(pct * width / 100.0)));
  std::string s(1, ' ');
  s.reserve(2 + static_cast<size_t>(width) * std::max(fill.size(), track.size()));
  for (int i = 0; i < filled; ++i) s += fill;
  for (int i = filled; i < width; ++i) s += track;
  s.push_back(' ');
  return s;
}

} // namespace hostwatch::util
