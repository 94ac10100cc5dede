#include "Simulation.h"

#include <sstream>
#include <stdexcept>

namespace AIF {

std::string EpisodeStatusName(EpisodeStatus status) {
  switch (status) {
    case EpisodeStatus::GoalReached:
      return "goal reached";
    case EpisodeStatus::StepLimit:
      return "step limit";
    case EpisodeStatus::Stalled:
      return "stalled";
  }
  return "unknown";
}

void ValidateScenario(const AgentConfig& config, const WorldInterface& world) {
  config.Validate();
  if (config.rows != world.Rows() || config.cols != world.Cols())
    throw std::invalid_argument(
        "Agent grid " + std::to_string(config.rows) + "x" +
        std::to_string(config.cols) + " does not match world " +
        std::to_string(world.Rows()) + "x" + std::to_string(world.Cols()));
  if (world.Occupancy(config.start) == Observation::Obstacle) {
    std::ostringstream ss;
    ss << "Start " << config.start << " is an obstacle";
    throw std::invalid_argument(ss.str());
  }
  if (world.Occupancy(config.goal) == Observation::Obstacle) {
    std::ostringstream ss;
    ss << "Goal " << config.goal << " is an obstacle";
    throw std::invalid_argument(ss.str());
  }
}

EpisodeResult RunEpisode(ActiveInferenceAgent& agent,
                         const WorldInterface& world, int64_t max_steps,
                         int64_t stall_limit, const StepObserver& observer,
                         std::ostream& os, bool verbose) {
  EpisodeResult result = {EpisodeStatus::StepLimit, 0, 0};
  int64_t stalled_for = 0;
  while (true) {
    if (agent.AtGoal()) {
      result.status = EpisodeStatus::GoalReached;
      break;
    }
    if (result.steps >= max_steps) {
      result.status = EpisodeStatus::StepLimit;
      break;
    }

    const Position before = agent.GetPosition();
    const StepRecord record = agent.Step(world);
    ++result.steps;
    if (verbose) os << "step " << result.steps << ": " << record << std::endl;
    if (observer) observer(agent, record, result.steps);

    if (record.position == before) {
      ++result.blocked_moves;
      ++stalled_for;
    } else {
      stalled_for = 0;
    }
    if (stall_limit > 0 && stalled_for >= stall_limit) {
      result.status = EpisodeStatus::Stalled;
      break;
    }
  }

  if (verbose) {
    if (result.GoalReached())
      os << "Goal reached in " << result.steps << " steps." << std::endl;
    else if (result.status == EpisodeStatus::Stalled)
      os << "Goal not reached, stalled at " << agent.GetPosition() << " for "
         << stalled_for << " steps." << std::endl;
    else
      os << "Goal not reached within " << max_steps << " steps." << std::endl;
  }
  return result;
}

EvaluationStats EvaluateEpisodes(const AgentConfig& config,
                                 const GridWorld& world, int64_t n_trials,
                                 int64_t max_steps, int64_t stall_limit,
                                 std::mt19937_64& rng, std::ostream& os) {
  ValidateScenario(config, world);
  const auto optimal = world.OptimalSteps(config.start, config.goal);
  if (!optimal.has_value())
    os << "Goal " << config.goal << " is unreachable from " << config.start
       << ", regret undefined." << std::endl;

  EvaluationStats stats;
  for (int64_t i = 0; i < n_trials; ++i) {
    ActiveInferenceAgent agent(config, rng());
    const auto result =
        RunEpisode(agent, world, max_steps, stall_limit, nullptr, os, false);
    ++stats.trials;
    if (result.status == EpisodeStatus::Stalled) ++stats.stalled;
    if (!result.GoalReached()) continue;
    ++stats.reached;
    stats.steps.Add(result.steps);
    if (optimal.has_value()) stats.regret.Add(result.steps - *optimal);
  }

  os << "Evaluation of policy (" << max_steps << " steps, " << n_trials
     << " trials):" << std::endl;
  os << "Reached goal: " << stats.reached << "/" << stats.trials
     << ", stalled: " << stats.stalled << std::endl;
  PrintStats(stats.steps, "EFE", "steps", os);
  PrintStats(stats.regret, "EFE", "regret", os);
  return stats;
}

}  // namespace AIF
