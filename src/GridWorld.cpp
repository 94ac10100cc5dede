#include "GridWorld.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace AIF {

GridWorld::GridWorld(int64_t rows, int64_t cols,
                     const std::vector<Position>& obstacles)
    : _rows(rows), _cols(cols) {
  if (rows <= 0 || cols <= 0)
    throw std::invalid_argument("Invalid grid dimensions " +
                                std::to_string(rows) + "x" +
                                std::to_string(cols));
  _occupancy.assign(rows * cols, 0);
  for (const auto& obs : obstacles) {
    if (!InBounds(obs)) {
      std::ostringstream ss;
      ss << "Obstacle " << obs << " outside " << rows << "x" << cols
         << " grid";
      throw std::out_of_range(ss.str());
    }
    _occupancy[obs.row * _cols + obs.col] = 1;
  }
}

Observation GridWorld::Occupancy(const Position& pos) const {
  if (!InBounds(pos)) {
    std::ostringstream ss;
    ss << "Occupancy query for " << pos << " outside the grid";
    throw std::out_of_range(ss.str());
  }
  return _occupancy[pos.row * _cols + pos.col] ? Observation::Obstacle
                                               : Observation::Free;
}

std::vector<Position> GridWorld::Obstacles() const {
  std::vector<Position> obstacles;
  for (int64_t r = 0; r < _rows; ++r)
    for (int64_t c = 0; c < _cols; ++c)
      if (_occupancy[r * _cols + c]) obstacles.push_back({r, c});
  return obstacles;
}

std::vector<PathEdge> GridWorld::Moves(const Position& cell) const {
  std::vector<PathEdge> moves;
  for (const auto action : ACTIONS) {
    const Position next = PredictNextPosition(cell, action);
    if (!InBounds(next) || Occupancy(next) == Observation::Obstacle) continue;
    moves.push_back({next, 1.0, action});
  }
  return moves;
}

std::optional<int64_t> GridWorld::OptimalSteps(const Position& source,
                                               const Position& target) const {
  const auto cost = Solve(source).Cost(target);
  if (!cost.has_value()) return std::nullopt;
  return static_cast<int64_t>(std::llround(*cost));
}

std::vector<Position> GridWorld::OptimalPath(const Position& source,
                                             const Position& target) const {
  return Solve(source).CellsTo(target);
}

GridSpec ParseGrid(const std::vector<std::string>& lines) {
  if (lines.empty()) throw std::invalid_argument("Empty grid");

  GridSpec spec;
  spec.rows = lines.size();
  spec.cols = lines.front().size();
  if (spec.cols == 0) throw std::invalid_argument("Empty grid row");

  bool found_start = false;
  bool found_goal = false;
  for (int64_t r = 0; r < spec.rows; ++r) {
    const std::string& line = lines[r];
    if ((int64_t)line.size() != spec.cols)
      throw std::invalid_argument("Grid row " + std::to_string(r) + " has " +
                                  std::to_string(line.size()) +
                                  " cells, expected " +
                                  std::to_string(spec.cols));
    for (int64_t c = 0; c < spec.cols; ++c) {
      switch (line[c]) {
        case '#':
          spec.obstacles.push_back({r, c});
          break;
        case '.':
        case ' ':
          break;
        case 'S':
          if (found_start) throw std::invalid_argument("Duplicate start 'S'");
          spec.start = {r, c};
          found_start = true;
          break;
        case 'G':
          if (found_goal) throw std::invalid_argument("Duplicate goal 'G'");
          spec.goal = {r, c};
          found_goal = true;
          break;
        default:
          throw std::invalid_argument(std::string("Unknown grid character '") +
                                      line[c] + "' in row " +
                                      std::to_string(r));
      }
    }
  }
  if (!found_start) throw std::invalid_argument("Grid has no start 'S'");
  if (!found_goal) throw std::invalid_argument("Grid has no goal 'G'");
  return spec;
}

GridSpec ReadGridFile(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Unable to open file: " + filename);
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    lines.push_back(line);
  }

  file.close();
  return ParseGrid(lines);
}

}  // namespace AIF
