#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "GridTypes.h"
#include "ShortestPath.h"

namespace AIF {

class WorldInterface {
 public:
  WorldInterface(){};
  virtual ~WorldInterface(){};

  // ------- obligate functions ----------
  virtual Observation Occupancy(const Position& pos) const = 0;
  virtual bool InBounds(const Position& pos) const = 0;
  virtual int64_t Rows() const = 0;
  virtual int64_t Cols() const = 0;
  // --------------------------------------------------------
};

/**
 * @brief Static occupancy grid: 0 is a free cell, 1 an obstacle.
 *
 * The grid is fixed at construction. Moves between free 4-neighbours are unit
 * cost edges for the shortest path solver.
 */
class GridWorld : public WorldInterface, public ShortestPathFasterAlgorithm {
 private:
  int64_t _rows;
  int64_t _cols;
  std::vector<uint8_t> _occupancy;

 public:
  GridWorld(int64_t rows, int64_t cols,
            const std::vector<Position>& obstacles = {});

  Observation Occupancy(const Position& pos) const override;
  bool InBounds(const Position& pos) const override {
    return pos.row >= 0 && pos.row < _rows && pos.col >= 0 && pos.col < _cols;
  }
  int64_t Rows() const override { return _rows; }
  int64_t Cols() const override { return _cols; }

  /// @brief Return every obstacle cell in row-major order
  std::vector<Position> Obstacles() const;

  /// @brief Unit cost moves into free in-bounds neighbours
  std::vector<PathEdge> Moves(const Position& cell) const override;

  /// @brief Minimum number of moves from source to target, or nullopt if the
  /// target cannot be reached
  std::optional<int64_t> OptimalSteps(const Position& source,
                                      const Position& target) const;

  /// @brief One shortest route from source to target, both included. Empty
  /// if the target cannot be reached.
  std::vector<Position> OptimalPath(const Position& source,
                                    const Position& target) const;
};

struct GridSpec {
  int64_t rows = 0;
  int64_t cols = 0;
  std::vector<Position> obstacles;
  Position start;
  Position goal;
};

/// @brief Parse a text grid: '#' obstacle, '.' or ' ' free, 'S' start and 'G'
/// goal
GridSpec ParseGrid(const std::vector<std::string>& lines);

GridSpec ReadGridFile(const std::string& filename);

}  // namespace AIF
