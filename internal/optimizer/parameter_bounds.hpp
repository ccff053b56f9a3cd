#pragma once

#include <string>
#include <vector>

namespace fabplan::optimizer {

struct ParameterBound {
  std::string name;
  double      min = 0.0;
  double      max = 0.0;

  bool Contains(double value) const {
    return value >= min && value <= max;
  }

  double Midpoint() const {
    return min + 0.5 * (max - min);
  }
};

// time_s in [5, 30], pressure_torr in [0.5, 3.0].
inline std::vector<ParameterBound> DefaultBounds() {
  return {{"time_s", 5.0, 30.0}, {"pressure_torr", 0.5, 3.0}};
}

} // namespace fabplan::optimizer
