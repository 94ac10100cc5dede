#include <GridWorld.h>
#include <ShortestPath.h>
#include <gtest/gtest.h>

#include <cstdlib>

using namespace AIF;

static void ExpectConnected(const std::vector<Position>& cells,
                            const GridWorld& world) {
  for (size_t i = 0; i < cells.size(); ++i) {
    EXPECT_EQ(world.Occupancy(cells[i]), Observation::Free) << cells[i];
    if (i == 0) continue;
    const int64_t dist = std::abs(cells[i].row - cells[i - 1].row) +
                         std::abs(cells[i].col - cells[i - 1].col);
    EXPECT_EQ(dist, 1) << cells[i - 1] << " -> " << cells[i];
  }
}

TEST(ShortestPathTest, ManhattanDistanceOnOpenGrid) {
  const GridWorld world(4, 5);
  const auto tree = world.Solve({0, 0});
  EXPECT_EQ(tree.Size(), 20);
  for (int64_t r = 0; r < 4; ++r)
    for (int64_t c = 0; c < 5; ++c)
      EXPECT_EQ(tree.Cost({r, c}).value_or(-1.0),
                static_cast<double>(r + c));

  const auto cells = tree.CellsTo({3, 4});
  ASSERT_EQ(cells.size(), 8);
  EXPECT_EQ(cells.front(), Position({0, 0}));
  EXPECT_EQ(cells.back(), Position({3, 4}));
  ExpectConnected(cells, world);
}

TEST(ShortestPathTest, RouteAroundWall) {
  // S . # .
  // . . # G
  // . . . .
  const GridWorld world(3, 4, {{0, 2}, {1, 2}});
  const auto tree = world.Solve({0, 0});
  EXPECT_FALSE(tree.Reachable({0, 2}));
  EXPECT_EQ(tree.Cost({1, 3}).value_or(-1.0), 6.0);

  const auto cells = tree.CellsTo({1, 3});
  ASSERT_EQ(cells.size(), 7);
  ExpectConnected(cells, world);
  EXPECT_EQ(cells[4], Position({2, 2}));  // the only gap in the wall

  // replaying the actions lands on the same cells
  const auto actions = tree.ActionsTo({1, 3});
  ASSERT_EQ(actions.size(), 6);
  Position pos = tree.Source();
  for (size_t i = 0; i < actions.size(); ++i) {
    pos = PredictNextPosition(pos, actions[i]);
    EXPECT_EQ(pos, cells[i + 1]);
  }
  EXPECT_EQ(world.OptimalPath({0, 0}, {1, 3}), cells);
}

TEST(ShortestPathTest, SourceAndUnreachableTargets) {
  const GridWorld world(3, 3, {{0, 1}, {1, 0}, {1, 1}});
  const auto tree = world.Solve({0, 0});
  EXPECT_EQ(tree.Size(), 1);
  EXPECT_EQ(tree.Cost({0, 0}).value_or(-1.0), 0.0);
  const std::vector<Position> only_source = {{0, 0}};
  EXPECT_EQ(tree.CellsTo({0, 0}), only_source);
  EXPECT_TRUE(tree.ActionsTo({0, 0}).empty());

  EXPECT_FALSE(tree.Cost({2, 2}).has_value());
  EXPECT_TRUE(tree.CellsTo({2, 2}).empty());
  EXPECT_TRUE(tree.ActionsTo({2, 2}).empty());
  EXPECT_TRUE(world.OptimalPath({0, 0}, {2, 2}).empty());
}

// A corridor along row 0 where stepping right costs more than detouring
// through row 1
class WeightedCorridor : public ShortestPathFasterAlgorithm {
 public:
  std::vector<PathEdge> Moves(const Position& cell) const override {
    if (cell == Position({0, 0}))
      return {{{0, 1}, 5.0, Action::Right}, {{1, 0}, 1.0, Action::Down}};
    if (cell == Position({1, 0})) return {{{1, 1}, 1.0, Action::Right}};
    if (cell == Position({1, 1})) return {{{0, 1}, 1.0, Action::Up}};
    return {};
  }
};

TEST(ShortestPathTest, PrefersCheaperDetour) {
  const WeightedCorridor corridor;
  const auto tree = corridor.Solve({0, 0});
  EXPECT_EQ(tree.Cost({0, 1}).value_or(-1.0), 3.0);
  const std::vector<Action> expected = {Action::Down, Action::Right,
                                        Action::Up};
  EXPECT_EQ(tree.ActionsTo({0, 1}), expected);
}

class NegativeMove : public ShortestPathFasterAlgorithm {
 public:
  std::vector<PathEdge> Moves(const Position& cell) const override {
    if (cell == Position({0, 0})) return {{{0, 1}, -1.0, Action::Right}};
    return {};
  }
};

TEST(ShortestPathTest, RejectsNegativeCost) {
  const NegativeMove graph;
  EXPECT_THROW(graph.Solve({0, 0}), std::invalid_argument);
}
