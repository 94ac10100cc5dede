#include "ExpectedFreeEnergy.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace AIF {

double InstrumentalValue(const BeliefMap& belief, const Position& goal) {
  return std::log(belief.At(goal) + BELIEF_EPSILON);
}

double KLDivergence(const BeliefMap& p, const BeliefMap& q) {
  if (p.Rows() != q.Rows() || p.Cols() != q.Cols())
    throw std::invalid_argument("KL divergence of mismatched beliefs");
  const auto& pv = p.Values();
  const auto& qv = q.Values();
  double kl = 0.0;
  for (size_t i = 0; i < pv.size(); ++i) {
    if (pv[i] <= 0.0) continue;
    kl += pv[i] * std::log((pv[i] + BELIEF_EPSILON) / (qv[i] + BELIEF_EPSILON));
  }
  return kl;
}

double EpistemicValue(const BeliefMap& belief, const Position& candidate) {
  const auto certain =
      BeliefMap::OneHot(belief.Rows(), belief.Cols(), candidate);
  return KLDivergence(certain, belief);
}

double ExpectedFreeEnergy(const BeliefMap& belief, const Position& pos,
                          const Position& goal, Action action) {
  const Position candidate = PredictNextPosition(pos, action);
  if (!belief.IsAccessible(candidate))
    return std::numeric_limits<double>::infinity();

  const double instrumental = InstrumentalValue(belief, goal);
  const double epistemic = EpistemicValue(belief, candidate);
  return -(instrumental + epistemic);
}

ActionScores ScoreActions(const BeliefMap& belief, const Position& pos,
                          const Position& goal) {
  ActionScores scores;
  for (size_t i = 0; i < ACTIONS.size(); ++i)
    scores[i] = {ACTIONS[i],
                 ExpectedFreeEnergy(belief, pos, goal, ACTIONS[i])};
  return scores;
}

Action SelectMinimumAction(const ActionScores& scores) {
  // scan from the back so the first minimum met is the latest in order
  auto best = scores.crbegin();
  for (auto it = scores.crbegin(); it != scores.crend(); ++it)
    if (it->second < best->second) best = it;
  return best->first;
}

}  // namespace AIF
