#include "SelfIntersection.hpp"

#include <gtest/gtest.h>

#include <initializer_list>

namespace {

using namespace thalweg;

Reach MakeReach(std::initializer_list<Pt> pts) { return Reach(pts.begin(), pts.end()); }

void ExpectReach(const Reach& actual, std::initializer_list<Pt> expected) {
  ASSERT_EQ(actual.size(), expected.size());
  auto it = expected.begin();
  for (const auto& p : actual) {
    EXPECT_NEAR(p.x, it->x, 1e-9);
    EXPECT_NEAR(p.y, it->y, 1e-9);
    ++it;
  }
}

TEST(SelfIntersectionTest, SimpleReachUnchanged) {
  const auto r = MakeReach({{0, 0}, {5, 1}, {10, 0}, {15, 2}});
  ExpectReach(RepairSelfIntersections(r), {{0, 0}, {5, 1}, {10, 0}, {15, 2}});
}

TEST(SelfIntersectionTest, LoopIsCutAtCrossing) {
  const auto r = MakeReach({{0, 0}, {10, 0}, {10, 5}, {5, 5}, {5, -5}, {20, -5}});
  ExpectReach(RepairSelfIntersections(r), {{0, 0}, {5, 0}, {5, -5}, {20, -5}});
}

TEST(SelfIntersectionTest, SeveralLoopsAreAllCut) {
  const auto r = MakeReach({{0, 0}, {4, 0}, {4, 2}, {2, 2}, {2, -2},
                            {10, -2}, {10, 0}, {8, 0}, {8, -4}});
  // First loop closes at (2, 0), the second at (8, -2).
  ExpectReach(RepairSelfIntersections(r), {{0, 0}, {2, 0}, {2, -2}, {8, -2}, {8, -4}});
}

TEST(SelfIntersectionTest, ClosedRingIsNotALoop) {
  const auto r = MakeReach({{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}});
  ExpectReach(RepairSelfIntersections(r), {{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}});
}

TEST(SelfIntersectionTest, RepeatedVerticesDropped) {
  const auto r = MakeReach({{0, 0}, {0, 0}, {1, 0}, {2, 0}, {2, 0}});
  ExpectReach(RepairSelfIntersections(r), {{0, 0}, {1, 0}, {2, 0}});
}

} // anonymous
