#pragma once

#include <array>
#include <utility>

#include "BeliefMap.h"
#include "GridTypes.h"

namespace AIF {

// (action, expected free energy) in ACTIONS order
using ActionScores = std::array<std::pair<Action, double>, ACTIONS.size()>;

/// @brief log-mass currently assigned to the goal cell.
///
/// Evaluated on the present belief, so it is identical for every candidate
/// action.
double InstrumentalValue(const BeliefMap& belief, const Position& goal);

/// @brief Relative entropy KL(p || q), with zero entries of p contributing
/// nothing and both arguments of the log stabilised by BELIEF_EPSILON.
double KLDivergence(const BeliefMap& p, const BeliefMap& q);

/// @brief KL divergence between a belief certain of `candidate` and the
/// current belief
double EpistemicValue(const BeliefMap& belief, const Position& candidate);

/**
 * @brief Expected free energy of taking `action` from `pos`.
 *
 * Returns +infinity if the predicted cell is off the grid or has been ruled
 * out by the belief, otherwise -(instrumental + epistemic). Lower is better.
 */
double ExpectedFreeEnergy(const BeliefMap& belief, const Position& pos,
                          const Position& goal, Action action);

/// @brief Score every action of the fixed action set
ActionScores ScoreActions(const BeliefMap& belief, const Position& pos,
                          const Position& goal);

/// @brief Return the action with the minimum score. Equal scores (infinite
/// ones included) resolve to the action latest in {up, down, left, right}.
Action SelectMinimumAction(const ActionScores& scores);

}  // namespace AIF
