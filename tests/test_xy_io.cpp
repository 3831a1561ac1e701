#include "XyIo.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using namespace thalweg;

TEST(XyIoTest, ReadsReachesAndSkipsComments) {
  auto in = std::istringstream{
      "# exported centerline\r\n"
      "# reach\n"
      "0 0\n"
      "1.5 2.5\r\n"
      "\n"
      "# reach\n"
      "# reach\n"
      "10 10\n"
      "   \t\n"
      "11 12\n"};
  const auto lines = ReadPolyline(in);
  ASSERT_EQ(lines.size(), 2u);
  ASSERT_EQ(lines[0].size(), 2u);
  EXPECT_EQ(lines[0][1], (Pt{1.5, 2.5}));
  ASSERT_EQ(lines[1].size(), 2u);
  EXPECT_EQ(lines[1][0], (Pt{10, 10}));
}

TEST(XyIoTest, PointsBeforeAnyMarkerFormAReach) {
  auto in = std::istringstream{"1 2\n3 4\n"};
  const auto lines = ReadPolyline(in);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].size(), 2u);
}

TEST(XyIoTest, MalformedLineReportsLineNumber) {
  auto in = std::istringstream{"# reach\n0 0\nzero one\n"};
  try {
    ReadPolyline(in);
    FAIL() << "expected an exception";
  }
  catch (const std::runtime_error& e) {
    EXPECT_NE(std::string{e.what()}.find("line 3"), std::string::npos);
  }
}

TEST(XyIoTest, WriteMarksEachReach) {
  auto lines = Polyline{};
  lines.resize(2);
  lines[0].push_back(Pt{0, 0});
  lines[0].push_back(Pt{1, 1});
  lines[1].push_back(Pt{5, 5});
  lines[1].push_back(Pt{6, 7});

  auto out = std::ostringstream{};
  WritePolyline(out, lines);
  EXPECT_EQ(out.str(), "# reach\n0 0\n1 1\n# reach\n5 5\n6 7\n");

  auto in = std::istringstream{out.str()};
  const auto back = ReadPolyline(in);
  ASSERT_EQ(back.size(), 2u);
  EXPECT_EQ(back[1][1], (Pt{6, 7}));
}

TEST(XyIoTest, MissingFileThrows) {
  EXPECT_THROW(ReadPolyline(std::filesystem::path{"/nonexistent/dir/lines.xy"}),
               std::runtime_error);
}

} // anonymous
