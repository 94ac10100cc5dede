#include <Simulation.h>
#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

using namespace AIF;

static AgentConfig MakeConfig(int64_t rows, int64_t cols, Position start,
                              Position goal, double exploration_rate = 0.0) {
  AgentConfig config;
  config.rows = rows;
  config.cols = cols;
  config.start = start;
  config.goal = goal;
  config.exploration_rate = exploration_rate;
  return config;
}

TEST(SimulationTest, GoalReachedInOneStep) {
  const GridWorld world(2, 2);
  ActiveInferenceAgent agent(MakeConfig(2, 2, {0, 0}, {0, 1}), 1);
  std::ostringstream log;
  std::vector<Action> actions;
  const auto result = RunEpisode(
      agent, world, 10, 0,
      [&actions](const ActiveInferenceAgent&, const StepRecord& record,
                 int64_t) { actions.push_back(record.action); },
      log);

  EXPECT_EQ(result.status, EpisodeStatus::GoalReached);
  EXPECT_TRUE(result.GoalReached());
  EXPECT_EQ(result.steps, 1);
  EXPECT_EQ(result.blocked_moves, 0);
  ASSERT_EQ(actions.size(), 1);
  EXPECT_EQ(actions[0], Action::Right);
  EXPECT_NEAR(agent.GetBelief().At({0, 1}), 1.0, 1e-6);
  ASSERT_EQ(agent.GetHistory().size(), 2);
  EXPECT_EQ(agent.GetHistory()[1], Position({0, 1}));
  EXPECT_NE(log.str().find("Goal reached in 1 steps."), std::string::npos);
}

TEST(SimulationTest, ZeroStepBudget) {
  const GridWorld world(3, 3);
  ActiveInferenceAgent agent(MakeConfig(3, 3, {0, 0}, {2, 2}), 1);
  std::ostringstream log;
  int observed = 0;
  const auto result = RunEpisode(
      agent, world, 0, 0,
      [&observed](const ActiveInferenceAgent&, const StepRecord&, int64_t) {
        ++observed;
      },
      log);

  EXPECT_EQ(result.status, EpisodeStatus::StepLimit);
  EXPECT_EQ(result.steps, 0);
  EXPECT_EQ(observed, 0);
  EXPECT_EQ(agent.GetHistory().size(), 1);
  EXPECT_EQ(agent.GetPosition(), Position({0, 0}));
  EXPECT_NE(log.str().find("Goal not reached within 0 steps."),
            std::string::npos);
}

TEST(SimulationTest, StartAtGoal) {
  const GridWorld world(2, 2);
  ActiveInferenceAgent agent(MakeConfig(2, 2, {1, 1}, {1, 1}), 1);
  std::ostringstream log;
  const auto result = RunEpisode(agent, world, 0, 0, nullptr, log);
  EXPECT_EQ(result.status, EpisodeStatus::GoalReached);
  EXPECT_EQ(result.steps, 0);
}

TEST(SimulationTest, StepLimitReached) {
  const GridWorld world(3, 3, {{0, 1}});
  ActiveInferenceAgent agent(MakeConfig(3, 3, {0, 0}, {2, 2}), 1);
  std::ostringstream log;
  const auto result = RunEpisode(agent, world, 5, 0, nullptr, log);
  EXPECT_EQ(result.status, EpisodeStatus::StepLimit);
  EXPECT_EQ(result.steps, 5);
  EXPECT_EQ(agent.GetHistory().size(), 6);
  EXPECT_EQ(agent.GetBelief().At({0, 1}), 0.0);
}

TEST(SimulationTest, DeadlockDetection) {
  // Once localised every neighbour is ruled out and the agent walks right
  // until the border stops it
  const GridWorld world(3, 3, {{0, 1}});
  ActiveInferenceAgent agent(MakeConfig(3, 3, {0, 0}, {2, 2}), 1);
  std::ostringstream log;
  const auto result = RunEpisode(agent, world, 100, 3, nullptr, log);

  EXPECT_EQ(result.status, EpisodeStatus::Stalled);
  EXPECT_EQ(result.steps, 7);
  EXPECT_EQ(result.blocked_moves, 4);
  EXPECT_EQ(agent.GetPosition(), Position({1, 2}));
  const std::vector<Position> expected_history = {
      {0, 0}, {0, 0}, {1, 0}, {1, 1}, {1, 2}, {1, 2}, {1, 2}, {1, 2}};
  EXPECT_EQ(agent.GetHistory(), expected_history);
  EXPECT_NE(log.str().find("stalled"), std::string::npos);
}

TEST(SimulationTest, QuietEpisodeWritesNothing) {
  const GridWorld world(2, 2);
  ActiveInferenceAgent agent(MakeConfig(2, 2, {0, 0}, {0, 1}), 1);
  std::ostringstream log;
  RunEpisode(agent, world, 10, 0, nullptr, log, false);
  EXPECT_TRUE(log.str().empty());
}

TEST(SimulationTest, ValidateScenario) {
  const GridWorld world(3, 3, {{1, 1}});
  EXPECT_NO_THROW(ValidateScenario(MakeConfig(3, 3, {0, 0}, {2, 2}), world));
  EXPECT_THROW(ValidateScenario(MakeConfig(3, 3, {1, 1}, {2, 2}), world),
               std::invalid_argument);
  EXPECT_THROW(ValidateScenario(MakeConfig(3, 3, {0, 0}, {1, 1}), world),
               std::invalid_argument);
  EXPECT_THROW(ValidateScenario(MakeConfig(4, 3, {0, 0}, {2, 2}), world),
               std::invalid_argument);
  EXPECT_THROW(ValidateScenario(MakeConfig(3, 3, {0, 0}, {2, 3}), world),
               std::out_of_range);
}

TEST(SimulationTest, EvaluateEpisodes) {
  const GridWorld world(2, 2);
  std::mt19937_64 rng(42);
  std::ostringstream log;
  const auto stats = EvaluateEpisodes(MakeConfig(2, 2, {0, 0}, {0, 1}), world,
                                      5, 10, 0, rng, log);
  EXPECT_EQ(stats.trials, 5);
  EXPECT_EQ(stats.reached, 5);
  EXPECT_EQ(stats.stalled, 0);
  EXPECT_EQ(stats.steps.Count(), 5);
  EXPECT_DOUBLE_EQ(stats.steps.Mean(), 1.0);
  EXPECT_DOUBLE_EQ(stats.regret.Mean(), 0.0);
  EXPECT_DOUBLE_EQ(stats.regret.Max(), 0.0);
  EXPECT_NE(log.str().find("Reached goal: 5/5"), std::string::npos);
  EXPECT_NE(log.str().find("EFE Average regret: 0.000000"), std::string::npos);
}

TEST(SimulationTest, EvaluateCountsStalledRuns) {
  const GridWorld world(3, 3, {{0, 1}});
  std::mt19937_64 rng(7);
  std::ostringstream log;
  const auto stats = EvaluateEpisodes(MakeConfig(3, 3, {0, 0}, {2, 2}, 0.0),
                                      world, 4, 50, 3, rng, log);
  // without exploration every run stalls at the right border
  EXPECT_EQ(stats.trials, 4);
  EXPECT_EQ(stats.reached, 0);
  EXPECT_EQ(stats.stalled, 4);
  EXPECT_EQ(stats.steps.Count(), 0);
}

TEST(RunningStatsTest, MeanSpreadAndExtremes) {
  RunningStats stats;
  for (const double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) stats.Add(x);
  EXPECT_EQ(stats.Count(), 8);
  EXPECT_DOUBLE_EQ(stats.Mean(), 5.0);
  EXPECT_NEAR(stats.Variance(), 32.0 / 7.0, 1e-12);
  EXPECT_NEAR(stats.StdDev(), std::sqrt(32.0 / 7.0), 1e-12);
  EXPECT_DOUBLE_EQ(stats.Max(), 9.0);
  EXPECT_DOUBLE_EQ(stats.Min(), 2.0);
}

TEST(RunningStatsTest, SingleSampleHasNoSpread) {
  RunningStats stats;
  stats.Add(3.0);
  EXPECT_EQ(stats.Count(), 1);
  EXPECT_DOUBLE_EQ(stats.Mean(), 3.0);
  EXPECT_EQ(stats.Variance(), 0.0);
  EXPECT_DOUBLE_EQ(stats.Min(), 3.0);
  EXPECT_DOUBLE_EQ(stats.Max(), 3.0);
}

TEST(RunningStatsTest, PrintEmptyStats) {
  std::ostringstream os;
  PrintStats(RunningStats(), "EFE", "steps", os);
  EXPECT_NE(os.str().find("EFE Count: 0"), std::string::npos);
  EXPECT_NE(os.str().find("EFE Highest steps: -inf"), std::string::npos);
  EXPECT_NE(os.str().find("EFE Lowest steps: inf"), std::string::npos);
  EXPECT_NE(os.str().find("EFE steps std dev: 0.000000"), std::string::npos);
}
