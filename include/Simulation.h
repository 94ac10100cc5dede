#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <random>
#include <string>

#include "ActiveInferenceAgent.h"
#include "AgentConfig.h"
#include "GridWorld.h"
#include "Sample.h"

namespace AIF {

enum class EpisodeStatus { GoalReached, StepLimit, Stalled };

std::string EpisodeStatusName(EpisodeStatus status);

struct EpisodeResult {
  EpisodeStatus status;
  int64_t steps;          // actions committed
  int64_t blocked_moves;  // steps that left the position unchanged

  bool GoalReached() const { return status == EpisodeStatus::GoalReached; }
};

// agent after the step, the step taken, step number (1-based)
using StepObserver =
    std::function<void(const ActiveInferenceAgent&, const StepRecord&, int64_t)>;

/// @brief Throw std::invalid_argument if the configuration does not fit the
/// world, or if the start or goal cell is an obstacle
void ValidateScenario(const AgentConfig& config, const WorldInterface& world);

/**
 * @brief Run the perception-action cycle until the goal is reached or a limit
 * is hit.
 *
 * The goal check happens at the start of every cycle, before an action is
 * chosen, so max_steps = 0 never chooses an action.
 *
 * @param agent Agent to run, mutated in place
 * @param world Environment answering occupancy queries
 * @param max_steps Step budget
 * @param stall_limit Stop after this many consecutive steps without moving.
 * 0 disables deadlock detection.
 * @param observer Called after every step, e.g. for rendering
 * @param os Stream for progress output
 * @param verbose Log every step and the final status
 */
EpisodeResult RunEpisode(ActiveInferenceAgent& agent,
                         const WorldInterface& world, int64_t max_steps,
                         int64_t stall_limit = 0,
                         const StepObserver& observer = nullptr,
                         std::ostream& os = std::cout, bool verbose = true);

struct EvaluationStats {
  int64_t trials = 0;
  int64_t reached = 0;
  int64_t stalled = 0;
  RunningStats steps;   // over episodes that reached the goal
  RunningStats regret;  // steps - optimal steps, same episodes
};

/// @brief Run n_trials independent episodes, each with its own agent seeded
/// from rng, and print success counts and step / regret statistics
EvaluationStats EvaluateEpisodes(const AgentConfig& config,
                                 const GridWorld& world, int64_t n_trials,
                                 int64_t max_steps, int64_t stall_limit,
                                 std::mt19937_64& rng,
                                 std::ostream& os = std::cout);

}  // namespace AIF
