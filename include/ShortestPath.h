/* This file has been written and/or modified by the following people:
 *
 * Yang You
 * Alex Schutz
 *
 */

#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "GridTypes.h"

namespace AIF {

/// A move out of a cell: the cell it lands in, its cost and the action taken
struct PathEdge {
  Position to;
  double cost;
  Action action;
};

/**
 * @brief Shortest path costs and predecessors out of a single source cell.
 *
 * Cells missing from the tree are unreachable from the source.
 */
class PathTree {
 private:
  Position _source;
  PositionMap<double> _costs;
  PositionMap<std::pair<Position, Action>> _predecessor;

 public:
  PathTree(const Position& source, PositionMap<double> costs,
           PositionMap<std::pair<Position, Action>> predecessor);

  const Position& Source() const { return _source; }
  size_t Size() const { return _costs.size(); }
  bool Reachable(const Position& target) const {
    return _costs.find(target) != _costs.cend();
  }

  std::optional<double> Cost(const Position& target) const;

  /// @brief Cells visited from the source to `target`, both included. Empty
  /// if `target` is unreachable.
  std::vector<Position> CellsTo(const Position& target) const;

  /// @brief Actions leading from the source to `target`. Empty if `target` is
  /// the source or is unreachable.
  std::vector<Action> ActionsTo(const Position& target) const;
};

/**
 * @brief Implements the Shortest Path Faster Algorithm (SPFA)
 *
 * Inherit from this class to calculate the cheapest route from a source cell
 * to every reachable cell, following the moves given by `Moves`.
 */
class ShortestPathFasterAlgorithm {
 public:
  ShortestPathFasterAlgorithm() = default;
  virtual ~ShortestPathFasterAlgorithm() = default;

  /// @brief Moves out of `cell`. Costs must be non-negative.
  virtual std::vector<PathEdge> Moves(const Position& cell) const = 0;

  /// @brief Solve from `source` to every reachable cell. Throws
  /// std::invalid_argument on a negative move cost.
  PathTree Solve(const Position& source) const;
};

}  // namespace AIF
