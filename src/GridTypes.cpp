#include "GridTypes.h"

#include <stdexcept>

namespace AIF {

std::ostream& operator<<(std::ostream& os, const Position& pos) {
  os << "(" << pos.row << ", " << pos.col << ")";
  return os;
}

std::string ActionName(Action action) {
  switch (action) {
    case Action::Up:
      return "up";
    case Action::Down:
      return "down";
    case Action::Left:
      return "left";
    case Action::Right:
      return "right";
  }
  throw std::logic_error("Unknown action " +
                         std::to_string(static_cast<int>(action)));
}

Action ParseAction(const std::string& name) {
  for (const auto action : ACTIONS)
    if (ActionName(action) == name) return action;
  throw std::invalid_argument("Unknown action name: " + name);
}

std::string ObservationName(Observation obs) {
  return obs == Observation::Free ? "free" : "obstacle";
}

std::ostream& operator<<(std::ostream& os, Action action) {
  return os << ActionName(action);
}

std::ostream& operator<<(std::ostream& os, Observation obs) {
  return os << ObservationName(obs);
}

Position PredictNextPosition(const Position& pos, Action action) {
  switch (action) {
    case Action::Up:
      return {pos.row - 1, pos.col};
    case Action::Down:
      return {pos.row + 1, pos.col};
    case Action::Left:
      return {pos.row, pos.col - 1};
    case Action::Right:
      return {pos.row, pos.col + 1};
  }
  return pos;
}

}  // namespace AIF
