#include "ActiveInferenceAgent.h"

namespace AIF {

static const AgentConfig& Validated(const AgentConfig& config) {
  config.Validate();
  return config;
}

ActiveInferenceAgent::ActiveInferenceAgent(const AgentConfig& config,
                                           uint64_t seed)
    : _config(Validated(config)),
      _belief(BeliefMap::Initial(config.rows, config.cols, config.start)),
      _position(config.start),
      _history({config.start}),
      _rng(seed) {}

double ActiveInferenceAgent::ScoreAction(Action action) const {
  return ExpectedFreeEnergy(_belief, _position, _config.goal, action);
}

ActionScores ActiveInferenceAgent::ScoreActions() const {
  return AIF::ScoreActions(_belief, _position, _config.goal);
}

Action ActiveInferenceAgent::ChooseAction(double exploration_rate) {
  // check if we should explore randomly
  std::uniform_real_distribution<double> unif(0, 1);
  const double u = unif(_rng);
  if (u < exploration_rate) {
    std::uniform_int_distribution<size_t> action_dist(0, ACTIONS.size() - 1);
    return ACTIONS[action_dist(_rng)];
  }

  // choose the best action
  return SelectMinimumAction(ScoreActions());
}

StepRecord ActiveInferenceAgent::Act(Action action,
                                     const WorldInterface& world) {
  const Position target = PredictNextPosition(_position, action);
  Observation obs = Observation::Obstacle;
  // Leaving the grid is a collision with no cell to rule out
  if (world.InBounds(target) && _belief.InBounds(target)) {
    obs = world.Occupancy(target);
    _belief.Update(obs, target);
    if (obs == Observation::Free) _position = target;
  }
  _history.push_back(_position);
  return {action, target, obs, _position};
}

StepRecord ActiveInferenceAgent::Step(const WorldInterface& world) {
  return Act(ChooseAction(), world);
}

std::ostream& operator<<(std::ostream& os, const StepRecord& record) {
  os << "perform action: " << record.action << " towards " << record.target
     << ", receive obs: " << record.observation
     << ", position: " << record.position;
  return os;
}

}  // namespace AIF
