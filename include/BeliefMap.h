#pragma once

#include <cstdint>
#include <iostream>
#include <vector>

#include "GridTypes.h"

namespace AIF {

// Stabiliser added to sums and log arguments
constexpr double BELIEF_EPSILON = 1e-8;

// Cells holding less mass than this are treated as known obstacles
constexpr double BLOCKED_THRESHOLD = 1e-10;

/**
 * @brief Probability mass over the cells of a rows x cols grid.
 *
 * Entries are stored row-major and are never negative. Every mutating
 * operation ends with a renormalisation, so the entries sum to one (or to zero
 * for a fully ruled out map).
 */
class BeliefMap {
 private:
  int64_t _rows;
  int64_t _cols;
  std::vector<double> _values;

  size_t Index(const Position& pos) const;

 public:
  /// @brief All-zero belief of the given dimensions
  BeliefMap(int64_t rows, int64_t cols);

  /// @brief Uniform belief with the start cell folded in, then normalised
  static BeliefMap Initial(int64_t rows, int64_t cols, const Position& start);

  /// @brief Belief holding all of its mass at `pos`
  static BeliefMap OneHot(int64_t rows, int64_t cols, const Position& pos);

  int64_t Rows() const { return _rows; }
  int64_t Cols() const { return _cols; }
  const std::vector<double>& Values() const { return _values; }

  bool InBounds(const Position& pos) const {
    return pos.row >= 0 && pos.row < _rows && pos.col >= 0 && pos.col < _cols;
  }

  /// @brief Return the mass at `pos`. Throws std::out_of_range outside the
  /// grid.
  double At(const Position& pos) const { return _values.at(Index(pos)); }

  void Set(const Position& pos, double value);

  double Sum() const;

  /// @brief Whether `pos` lies on the grid and has not been ruled out
  bool IsAccessible(const Position& pos) const;

  /// @brief Divide every entry by (sum + BELIEF_EPSILON). An all-zero map
  /// stays all-zero.
  void Normalize();

  /// @brief Fold the outcome of a move attempt towards `target` into the
  /// belief.
  ///
  /// An obstacle observation zeroes the mass at `target`. A free observation
  /// collapses the belief onto `target`.
  void Update(Observation obs, const Position& target);

  bool operator==(const BeliefMap& other) const {
    return _rows == other._rows && _cols == other._cols &&
           _values == other._values;
  }
};

std::ostream& operator<<(std::ostream& os, const BeliefMap& belief);

}  // namespace AIF
