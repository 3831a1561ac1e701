#include "CenterlineAdjuster.hpp"
#include "TestSurfaces.hpp"

#include <boost/geometry/algorithms/is_simple.hpp>
#include <gtest/gtest.h>

#include <cmath>
#include <initializer_list>
#include <optional>

namespace {

using namespace thalweg;
using thalweg::fixtures::FunctionSurface;

// V-shaped valley running east-west with its floor along y = 3.
const auto Valley = FunctionSurface{[](const Pt& p) {
  return std::optional{100.0 + std::abs(p.y - 3.0)};
}};

Reach EastLine() {
  auto r = Reach{};
  for (int x = 0; x <= 20; x += 2)
    r.push_back(Pt{static_cast<double>(x), 0.0});
  return r;
}

RelaxOptions Options() {
  auto o = RelaxOptions{};
  o.searchDistance = 5.0;
  o.spacing = 1.0;
  return o;
}

TEST(RelaxReachTest, VerticesMoveToValleyFloor) {
  auto stats = RelaxStats{};
  const auto relaxed = RelaxReach(EastLine(), Valley, Options(), stats);
  ASSERT_EQ(relaxed.size(), 11u);
  for (std::size_t i = 0; i != relaxed.size(); ++i) {
    EXPECT_NEAR(relaxed[i].x, 2.0 * i, 1e-9);
    EXPECT_NEAR(relaxed[i].y, 3.0, 1e-9);
  }
  EXPECT_EQ(stats.vertices, 11u);
  EXPECT_EQ(stats.moved, 11u);
  EXPECT_EQ(stats.noData, 0u);
}

TEST(RelaxReachTest, NoDataAtVertexKeepsIt) {
  const auto holey = FunctionSurface{[](const Pt& p) -> std::optional<double> {
    if (std::abs(p.x - 10.0) < 0.5 && std::abs(p.y) < 0.5)
      return std::nullopt;
    return 100.0 + std::abs(p.y - 3.0);
  }};
  auto stats = RelaxStats{};
  const auto relaxed = RelaxReach(EastLine(), holey, Options(), stats);
  ASSERT_EQ(relaxed.size(), 11u);
  EXPECT_EQ(relaxed[5], (Pt{10.0, 0.0}));
  EXPECT_NEAR(relaxed[4].y, 3.0, 1e-9);
  EXPECT_NEAR(relaxed[6].y, 3.0, 1e-9);
  EXPECT_EQ(stats.noData, 1u);
  EXPECT_EQ(stats.moved, 10u);
}

TEST(RelaxReachTest, HugeThresholdLeavesReachUnchanged) {
  auto options = Options();
  options.threshold = 1.0e9;
  auto stats = RelaxStats{};
  const auto line = EastLine();
  const auto relaxed = RelaxReach(line, Valley, options, stats);
  ASSERT_EQ(relaxed.size(), line.size());
  for (std::size_t i = 0; i != line.size(); ++i)
    EXPECT_EQ(relaxed[i], line[i]);
  EXPECT_EQ(stats.moved, 0u);
}

TEST(RelaxReachTest, RejectsSpacingWithoutMidpointSample) {
  auto options = Options();
  options.spacing = 2.0;  // 10 / 2 = 5 intervals
  auto stats = RelaxStats{};
  EXPECT_THROW(RelaxReach(EastLine(), Valley, options, stats),
               InvalidSamplingConfigurationError);
  EXPECT_EQ(stats.vertices, 0u);
}

TEST(RelaxPolylineTest, DegenerateReachCopiedThrough) {
  auto lines = Polyline{};
  lines.push_back(EastLine());
  lines.push_back(Reach{});
  lines.back().push_back(Pt{50.0, 50.0});

  const auto out = RelaxPolyline(lines, Valley, Options());
  ASSERT_EQ(out.size(), 2u);
  ASSERT_EQ(out[0].size(), 11u);
  EXPECT_NEAR(out[0].front().y, 3.0, 1e-9);
  ASSERT_EQ(out[1].size(), 1u);
  EXPECT_EQ(out[1].front(), (Pt{50.0, 50.0}));
}

// Narrow pits pulling the lower leg of a hairpin north to y = 3 and the
// upper leg south to y = 1, so the relaxed legs cross.
const auto CrossingPits = FunctionSurface{[](const Pt& p) {
  auto pit = [&](double x0, double y0) {
    return std::abs(p.x - x0) < 0.25 && std::abs(p.y - y0) < 0.25;
  };
  for (auto x0 : {1.0, 3.0, 5.0})
    if (pit(x0, 3.0)) return std::optional{90.0};
  for (auto x0 : {2.0, 4.0, 6.0})
    if (pit(x0, 1.0)) return std::optional{90.0};
  return std::optional{100.0};
}};

TEST(RelaxPolylineTest, CrossingsFromRelaxationAreRepaired) {
  auto hairpin = Reach{};
  for (const auto& p : {Pt{1, 0}, Pt{3, 0}, Pt{5, 0}, Pt{10, 0},
                        Pt{10, 4}, Pt{6, 4}, Pt{4, 4}, Pt{2, 4}})
    hairpin.push_back(p);

  auto stats = RelaxStats{};
  const auto relaxed = RelaxReach(hairpin, CrossingPits, Options(), stats);
  ASSERT_EQ(relaxed.size(), 8u);
  EXPECT_NEAR(relaxed[2].y, 3.0, 1e-9);
  EXPECT_NEAR(relaxed[5].y, 1.0, 1e-9);
  EXPECT_FALSE(boost::geometry::is_simple(relaxed));

  auto lines = Polyline{};
  lines.push_back(hairpin);
  const auto out = RelaxPolyline(lines, CrossingPits, Options());
  ASSERT_EQ(out.size(), 1u);
  const auto& r = out[0];
  EXPECT_TRUE(boost::geometry::is_simple(r));

  // (5, 3)-(10, 0) meets (10, 4)-(6, 1); the corner loop is cut there.
  ASSERT_EQ(r.size(), 7u);
  const auto x = 9.5 / 1.35;
  EXPECT_NEAR(r[2].x, 5.0, 1e-9);
  EXPECT_NEAR(r[2].y, 3.0, 1e-9);
  EXPECT_NEAR(r[3].x, x, 1e-9);
  EXPECT_NEAR(r[3].y, 0.75 * x - 3.5, 1e-9);
  EXPECT_NEAR(r[4].x, 6.0, 1e-9);
  EXPECT_NEAR(r[4].y, 1.0, 1e-9);
  EXPECT_NEAR(r.back().x, 2.0, 1e-9);
  EXPECT_NEAR(r.back().y, 1.0, 1e-9);
}

TEST(RelaxPolylineTest, ValidatesBeforeProcessing) {
  auto lines = Polyline{};
  lines.push_back(EastLine());
  auto options = Options();
  options.searchDistance = 0.0;
  EXPECT_THROW(RelaxPolyline(lines, Valley, options),
               InvalidSamplingConfigurationError);
}

} // anonymous
