#include "Render.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace AIF {

// darkest to brightest
static const std::string SHADES = " .:-=+%@";

void RenderBelief(std::ostream& os, const BeliefMap& belief,
                  const std::vector<Position>& history,
                  const Position& position, const Position& goal,
                  const std::vector<Position>& obstacles) {
  if (!os) throw std::logic_error("Invalid output file");

  const auto& values = belief.Values();
  const double max_p = *std::max_element(values.cbegin(), values.cend());

  std::unordered_set<Position, PositionHash> visited(history.cbegin(),
                                                     history.cend());
  std::unordered_set<Position, PositionHash> blocked(obstacles.cbegin(),
                                                     obstacles.cend());

  const std::string border = "+" + std::string(belief.Cols(), '-') + "+";
  os << border << std::endl;
  for (int64_t r = 0; r < belief.Rows(); ++r) {
    os << "|";
    for (int64_t c = 0; c < belief.Cols(); ++c) {
      const Position cell = {r, c};
      if (cell == position) {
        os << 'A';
      } else if (cell == goal) {
        os << 'G';
      } else if (blocked.count(cell)) {
        os << '#';
      } else if (visited.count(cell)) {
        os << '*';
      } else {
        size_t shade = 0;
        if (max_p > 0.0) {
          shade = static_cast<size_t>(belief.At(cell) / max_p *
                                      (SHADES.size() - 1));
          shade = std::min(shade, SHADES.size() - 1);
        }
        os << SHADES[shade];
      }
    }
    os << "|" << std::endl;
  }
  os << border << std::endl;
}

void WriteBeliefCSV(std::ostream& os, const BeliefMap& belief) {
  if (!os) throw std::logic_error("Invalid output file");
  for (int64_t r = 0; r < belief.Rows(); ++r) {
    for (int64_t c = 0; c < belief.Cols(); ++c) {
      if (c > 0) os << ",";
      os << belief.At({r, c});
    }
    os << std::endl;
  }
}

void WriteHistoryCSV(std::ostream& os, const std::vector<Position>& history) {
  if (!os) throw std::logic_error("Invalid output file");
  os << "step,row,col" << std::endl;
  for (size_t i = 0; i < history.size(); ++i)
    os << i << "," << history[i].row << "," << history[i].col << std::endl;
}

}  // namespace AIF
