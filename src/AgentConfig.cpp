#include "AgentConfig.h"

#include <sstream>
#include <stdexcept>
#include <string>

namespace AIF {

void AgentConfig::Validate() const {
  if (rows <= 0 || cols <= 0)
    throw std::invalid_argument("Grid dimensions must be positive, got " +
                                std::to_string(rows) + "x" +
                                std::to_string(cols));
  if (!(exploration_rate >= 0.0 && exploration_rate <= 1.0))
    throw std::invalid_argument("Exploration rate must lie in [0, 1], got " +
                                std::to_string(exploration_rate));
  if (!InBounds(start)) {
    std::ostringstream ss;
    ss << "Start " << start << " outside " << rows << "x" << cols << " grid";
    throw std::out_of_range(ss.str());
  }
  if (!InBounds(goal)) {
    std::ostringstream ss;
    ss << "Goal " << goal << " outside " << rows << "x" << cols << " grid";
    throw std::out_of_range(ss.str());
  }
}

}  // namespace AIF
