#pragma once

#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>

namespace AIF {

struct Position {
  int64_t row = 0;
  int64_t col = 0;

  bool operator==(const Position& other) const {
    return row == other.row && col == other.col;
  }
  bool operator!=(const Position& other) const { return !(*this == other); }
};

struct PositionHash {
  std::size_t operator()(const Position& pos) const {
    std::size_t hash = 0;
    std::hash<int64_t> hasher;
    for (int64_t i : {pos.row, pos.col})
      hash ^= hasher(i) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    return hash;
  }
};

template <typename T>
using PositionMap = std::unordered_map<Position, T, PositionHash>;

std::ostream& operator<<(std::ostream& os, const Position& pos);

enum class Action { Up = 0, Down = 1, Left = 2, Right = 3 };

// Fixed evaluation order of the action set
constexpr std::array<Action, 4> ACTIONS = {Action::Up, Action::Down,
                                           Action::Left, Action::Right};

enum class Observation { Free = 0, Obstacle = 1 };

std::string ActionName(Action action);

/// @brief Return the action named `name` ("up", "down", "left" or "right")
Action ParseAction(const std::string& name);

std::string ObservationName(Observation obs);

std::ostream& operator<<(std::ostream& os, Action action);
std::ostream& operator<<(std::ostream& os, Observation obs);

/// @brief Return the cell reached by applying the displacement of `action` to
/// `pos`. No bounds checking is performed.
Position PredictNextPosition(const Position& pos, Action action);

}  // namespace AIF
