#include "BeliefMap.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace AIF {

BeliefMap::BeliefMap(int64_t rows, int64_t cols) : _rows(rows), _cols(cols) {
  if (rows <= 0 || cols <= 0)
    throw std::invalid_argument("Invalid belief dimensions " +
                                std::to_string(rows) + "x" +
                                std::to_string(cols));
  _values.assign(rows * cols, 0.0);
}

size_t BeliefMap::Index(const Position& pos) const {
  if (!InBounds(pos))
    throw std::out_of_range("Cell (" + std::to_string(pos.row) + ", " +
                            std::to_string(pos.col) + ") outside " +
                            std::to_string(_rows) + "x" +
                            std::to_string(_cols) + " grid");
  return pos.row * _cols + pos.col;
}

BeliefMap BeliefMap::Initial(int64_t rows, int64_t cols,
                             const Position& start) {
  BeliefMap belief(rows, cols);
  std::fill(belief._values.begin(), belief._values.end(), 1.0);
  belief.Set(start, 1.0);
  belief.Normalize();
  return belief;
}

BeliefMap BeliefMap::OneHot(int64_t rows, int64_t cols, const Position& pos) {
  BeliefMap belief(rows, cols);
  belief.Set(pos, 1.0);
  return belief;
}

void BeliefMap::Set(const Position& pos, double value) {
  if (value < 0.0)
    throw std::invalid_argument("Negative belief mass " +
                                std::to_string(value));
  _values[Index(pos)] = value;
}

double BeliefMap::Sum() const {
  return std::accumulate(_values.cbegin(), _values.cend(), 0.0);
}

bool BeliefMap::IsAccessible(const Position& pos) const {
  return InBounds(pos) && At(pos) >= BLOCKED_THRESHOLD;
}

void BeliefMap::Normalize() {
  const double denom = Sum() + BELIEF_EPSILON;
  for (auto& v : _values) v /= denom;
}

void BeliefMap::Update(Observation obs, const Position& target) {
  const size_t target_idx = Index(target);
  if (obs == Observation::Obstacle) {
    _values[target_idx] = 0.0;
    Normalize();
    return;
  }
  // Perfect self-localisation: the product with a one-hot at the target
  // renormalises to that one-hot, whatever mass the target held
  std::fill(_values.begin(), _values.end(), 0.0);
  _values[target_idx] = 1.0;
}

std::ostream& operator<<(std::ostream& os, const BeliefMap& belief) {
  if (belief.Rows() * belief.Cols() > 25) {
    os << "{ Cells: " << belief.Rows() << "x" << belief.Cols()
       << ", mass: " << belief.Sum() << " }";
  } else {
    os << "{ ";
    for (int64_t r = 0; r < belief.Rows(); ++r) {
      os << "[";
      for (int64_t c = 0; c < belief.Cols(); ++c) {
        os << belief.At({r, c});
        if (c + 1 < belief.Cols()) os << ", ";
      }
      os << "] ";
    }
    os << "}";
  }
  return os;
}

}  // namespace AIF
