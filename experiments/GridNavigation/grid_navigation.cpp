#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>

#include "ActiveInferenceAgent.h"
#include "GridWorld.h"
#include "Params.h"
#include "Render.h"
#include "Simulation.h"

using namespace AIF;

static void WriteFile(const std::string& filename,
                      const std::function<void(std::ostream&)>& writer) {
  std::ofstream ofs(filename);
  writer(ofs);
  ofs.close();
  std::cout << "Wrote " << filename << std::endl;
}

int run(const RunParams& params) {
  // Initialise the world
  AgentConfig config;
  config.exploration_rate = params.exploration_rate;
  std::vector<Position> obstacles;
  if (!params.grid_file.empty()) {
    std::cout << "Reading grid " << params.grid_file << std::endl;
    const GridSpec spec = ReadGridFile(params.grid_file);
    config.rows = spec.rows;
    config.cols = spec.cols;
    config.start = spec.start;
    config.goal = spec.goal;
    obstacles = spec.obstacles;
  } else {
    config.rows = params.rows;
    config.cols = params.cols;
    config.start = params.start;
    config.goal = params.goal;
    obstacles = params.obstacles;
  }
  const GridWorld world(config.rows, config.cols, obstacles);
  ValidateScenario(config, world);

  std::cout << "Grid " << world.Rows() << "x" << world.Cols() << ", "
            << obstacles.size() << " obstacles, start " << config.start
            << ", goal " << config.goal << std::endl;
  const auto optimal_path = world.OptimalPath(config.start, config.goal);
  if (!optimal_path.empty()) {
    std::cout << "Optimal path length: " << optimal_path.size() - 1
              << std::endl;
    std::cout << "Optimal path:";
    for (const auto& cell : optimal_path) std::cout << " " << cell;
    std::cout << std::endl;
  } else {
    std::cout << "Goal is unreachable from start" << std::endl;
  }

  // Run a single episode
  std::cout << "Running agent (seed " << params.seed << ")" << std::endl;
  ActiveInferenceAgent agent(config, params.seed);
  StepObserver observer = nullptr;
  if (params.render) {
    observer = [&world](const ActiveInferenceAgent& a, const StepRecord&,
                        int64_t) {
      RenderBelief(std::cout, a.GetBelief(), a.GetHistory(), a.GetPosition(),
                   a.GetGoal(), world.Obstacles());
    };
    RenderBelief(std::cout, agent.GetBelief(), agent.GetHistory(),
                 agent.GetPosition(), agent.GetGoal(), world.Obstacles());
  }
  const auto result =
      RunEpisode(agent, world, params.max_steps, params.stall_limit, observer);
  std::cout << "Blocked moves: " << result.blocked_moves << std::endl;

  if (!params.belief_csv.empty())
    WriteFile(params.belief_csv, [&agent](std::ostream& os) {
      WriteBeliefCSV(os, agent.GetBelief());
    });
  if (!params.path_csv.empty())
    WriteFile(params.path_csv, [&agent](std::ostream& os) {
      WriteHistoryCSV(os, agent.GetHistory());
    });
  if (!params.optimal_csv.empty())
    WriteFile(params.optimal_csv, [&optimal_path](std::ostream& os) {
      WriteHistoryCSV(os, optimal_path);
    });

  // Evaluate over independent runs
  if (params.n_eval_trials > 0) {
    std::mt19937_64 rng(params.seed);
    EvaluateEpisodes(config, world, params.n_eval_trials, params.max_steps,
                     params.stall_limit, rng);
  }

  return result.GoalReached() ? 0 : 2;
}

int main(int argc, char* argv[]) {
  try {
    return run(parseArgs(argc, argv));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
