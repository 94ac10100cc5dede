#include <Render.h>
#include <gtest/gtest.h>

#include <sstream>

using namespace AIF;

TEST(RenderTest, UniformBeliefHeatmap) {
  const auto belief = BeliefMap::Initial(2, 2, {0, 0});
  std::ostringstream os;
  RenderBelief(os, belief, {{0, 0}}, {0, 0}, {0, 1}, {});
  EXPECT_EQ(os.str(),
            "+--+\n"
            "|AG|\n"
            "|@@|\n"
            "+--+\n");
}

TEST(RenderTest, PathAndObstacleOverlay) {
  auto belief = BeliefMap::Initial(2, 4, {0, 0});
  belief.Update(Observation::Obstacle, {1, 1});
  belief.Update(Observation::Free, {0, 2});
  const std::vector<Position> history = {{0, 0}, {0, 1}, {0, 1}, {0, 2}};
  std::ostringstream os;
  RenderBelief(os, belief, history, {0, 2}, {1, 3}, {{1, 1}});
  EXPECT_EQ(os.str(),
            "+----+\n"
            "|**A |\n"
            "| # G|\n"  // cells ruled out by the collapse render blank
            "+----+\n");
}

TEST(RenderTest, ShadesScaleWithMass) {
  BeliefMap belief(1, 3);
  belief.Set({0, 0}, 0.0);
  belief.Set({0, 1}, 0.5);
  belief.Set({0, 2}, 1.0);
  std::ostringstream os;
  RenderBelief(os, belief, {}, {5, 5}, {5, 5}, {});
  EXPECT_EQ(os.str(),
            "+---+\n"
            "| -@|\n"
            "+---+\n");
}

TEST(RenderTest, BeliefCSV) {
  std::ostringstream os;
  WriteBeliefCSV(os, BeliefMap::OneHot(2, 2, {0, 1}));
  EXPECT_EQ(os.str(), "0,1\n0,0\n");
}

TEST(RenderTest, HistoryCSV) {
  std::ostringstream os;
  WriteHistoryCSV(os, {{0, 0}, {0, 1}, {1, 1}});
  EXPECT_EQ(os.str(), "step,row,col\n0,0,0\n1,0,1\n2,1,1\n");
}

TEST(RenderTest, InvalidStreamThrows) {
  std::ostringstream os;
  os.setstate(std::ios::badbit);
  const auto belief = BeliefMap::Initial(2, 2, {0, 0});
  EXPECT_THROW(WriteBeliefCSV(os, belief), std::logic_error);
  EXPECT_THROW(WriteHistoryCSV(os, {}), std::logic_error);
  EXPECT_THROW(RenderBelief(os, belief, {}, {0, 0}, {1, 1}, {}),
               std::logic_error);
}
