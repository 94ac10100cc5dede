#pragma once

#include <iostream>
#include <random>
#include <vector>

#include "AgentConfig.h"
#include "BeliefMap.h"
#include "ExpectedFreeEnergy.h"
#include "GridWorld.h"

namespace AIF {

struct StepRecord {
  Action action;
  Position target;  // cell the move was attempted into
  Observation observation;
  Position position;  // committed position after the step
};

/**
 * @brief Single agent navigating a grid by minimising expected free energy.
 *
 * The agent owns its belief exclusively; concurrent runs need separate
 * agents.
 */
class ActiveInferenceAgent {
 public:
  ActiveInferenceAgent(const AgentConfig& config,
                       uint64_t seed = std::random_device{}());

  /// @brief Return the expected free energy of `action` under the current
  /// belief. +infinity for inadmissible actions.
  double ScoreAction(Action action) const;

  /// @brief Return the scores of every action in the fixed action order
  ActionScores ScoreActions() const;

  /// @brief Choose the action to take. Chooses a random action with
  /// probability exploration_rate, otherwise the action of minimum expected
  /// free energy.
  Action ChooseAction(double exploration_rate);
  Action ChooseAction() { return ChooseAction(_config.exploration_rate); }

  /// @brief Attempt `action` in `world`, update the belief from the outcome
  /// and commit the move if the target cell is free.
  StepRecord Act(Action action, const WorldInterface& world);

  /// @brief Choose an action with the configured exploration rate and act
  StepRecord Step(const WorldInterface& world);

  bool AtGoal() const { return _position == _config.goal; }

  const BeliefMap& GetBelief() const { return _belief; }
  const Position& GetPosition() const { return _position; }
  const Position& GetGoal() const { return _config.goal; }
  const std::vector<Position>& GetHistory() const { return _history; }
  const AgentConfig& GetConfig() const { return _config; }

 private:
  AgentConfig _config;
  BeliefMap _belief;
  Position _position;
  std::vector<Position> _history;
  std::mt19937_64 _rng;
};

std::ostream& operator<<(std::ostream& os, const StepRecord& record);

}  // namespace AIF
