#pragma once

#include <cstdint>

#include "GridTypes.h"

namespace AIF {

struct AgentConfig {
  int64_t rows = 10;              // grid height
  int64_t cols = 10;              // grid width
  Position start = {0, 0};        // known starting cell
  Position goal = {9, 9};         // preferred cell
  double exploration_rate = 0.1;  // probability of a uniformly random action

  /// @brief Throw std::invalid_argument or std::out_of_range if the
  /// configuration cannot describe a run
  void Validate() const;

  bool InBounds(const Position& pos) const {
    return pos.row >= 0 && pos.row < rows && pos.col >= 0 && pos.col < cols;
  }
};

}  // namespace AIF
