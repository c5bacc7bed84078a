#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cb_layout.hpp"

using codebreak::DisplayLine;
using codebreak::LayoutParams;
using codebreak::LayoutResult;
using codebreak::MonospaceMetrics;

namespace {

std::vector<DisplayLine> NumberedLines(int count) {
  std::vector<DisplayLine> lines;
  for (int i = 1; i <= count; ++i) {
    lines.push_back({i, "line" + std::to_string(i)});
  }
  return lines;
}

}  // namespace

// Сетка 8x16, высота строки max(16, 16 + 2) = 18
class LayoutTest : public ::testing::Test {
 protected:
  MonospaceMetrics metrics{8, 16, 12};
  LayoutParams params;

  LayoutResult Layout(const std::vector<DisplayLine>& lines, int anchor = 0,
                      int width = 640, int height = 360,
                      std::size_t max_lines = 56) {
    return codebreak::layout(lines, anchor, max_lines, width, height, metrics,
                             params);
  }
};

/* ===== Поворот от якоря ===== */

TEST(RotateTest, WrapsAroundFromAnchor) {
  std::vector<int> items = {1, 2, 3, 4, 5};
  std::vector<int> expected = {4, 5, 1, 2};
  EXPECT_EQ(codebreak::rotate_from_anchor(items, 3, 4), expected);
}

TEST(RotateTest, LimitLargerThanSequence) {
  std::vector<int> items = {1, 2, 3};
  std::vector<int> expected = {2, 3, 1};
  EXPECT_EQ(codebreak::rotate_from_anchor(items, 1, 100), expected);
}

TEST(RotateTest, OutOfRangeAnchorFallsBackToZero) {
  std::vector<int> items = {1, 2, 3};
  std::vector<int> expected = {1, 2, 3};
  EXPECT_EQ(codebreak::rotate_from_anchor(items, 7, 3), expected);
  EXPECT_EQ(codebreak::rotate_from_anchor(items, -1, 3), expected);
}

TEST(RotateTest, EmptySequence) {
  std::vector<int> items;
  EXPECT_TRUE(codebreak::rotate_from_anchor(items, 0, 10).empty());
}

TEST_F(LayoutTest, RenderLinesFollowRotation) {
  LayoutResult r = Layout(NumberedLines(5), 3, 640, 360, 4);
  ASSERT_EQ(r.render_lines.size(), 4u);
  EXPECT_EQ(r.render_lines[0].line_number, 4);
  EXPECT_EQ(r.render_lines[1].line_number, 5);
  EXPECT_EQ(r.render_lines[2].line_number, 1);
  EXPECT_EQ(r.render_lines[3].line_number, 2);
}

TEST_F(LayoutTest, EmptyInputGivesNothing) {
  LayoutResult r = Layout({});
  EXPECT_TRUE(r.bricks.empty());
  EXPECT_TRUE(r.render_lines.empty());
}

/* ===== Токены ===== */

TEST(TokenTest, ConcatenationReproducesLine) {
  const std::string line = "  int x\t=  foo(1, 2);   // comment ";
  std::vector<std::string> tokens = codebreak::split_tokens(line);

  std::string joined;
  for (const auto& t : tokens) joined += t;
  EXPECT_EQ(joined, line);

  // токены чередуются: пробельный, непробельный, ...
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    EXPECT_NE(codebreak::is_whitespace_token(tokens[i - 1]),
              codebreak::is_whitespace_token(tokens[i]))
        << "index " << i;
  }

  // повторное разбиение даёт то же самое
  std::string rejoined;
  for (const auto& t : codebreak::split_tokens(joined)) rejoined += t;
  EXPECT_EQ(rejoined, line);
}

TEST(TokenTest, SplitsSimpleLine) {
  std::vector<std::string> expected = {"mov", " ", "eax,", " ", "ebx"};
  EXPECT_EQ(codebreak::split_tokens("mov eax, ebx"), expected);
}

TEST(TokenTest, EmptyLineHasNoTokens) {
  EXPECT_TRUE(codebreak::split_tokens("").empty());
}

TEST(TokenTest, VeryLongRunIsOneToken) {
  const std::string word(200000, 'x');
  std::vector<std::string> tokens = codebreak::split_tokens(word);
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0], word);

  const std::string blank(150000, ' ');
  tokens = codebreak::split_tokens(word + blank + "\t\v\f\r" + word);
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[1], blank + "\t\v\f\r");
  EXPECT_TRUE(codebreak::is_whitespace_token(tokens[1]));
  EXPECT_FALSE(codebreak::is_whitespace_token(tokens[2]));
}

TEST(TokenTest, VeryLongMixedLine) {
  std::string line;
  for (int i = 0; i < 100000; ++i) line += "ab ";
  std::vector<std::string> tokens = codebreak::split_tokens(line);
  ASSERT_EQ(tokens.size(), 200000u);

  std::string joined;
  joined.reserve(line.size());
  for (const auto& t : tokens) joined += t;
  EXPECT_EQ(joined, line);
  EXPECT_EQ(tokens.front(), "ab");
  EXPECT_EQ(tokens.back(), " ");
}

TEST(MetricsTest, MonospaceCountsCodePoints) {
  MonospaceMetrics m(8, 16, 12);
  EXPECT_DOUBLE_EQ(m.advance("abc"), 24.0);
  EXPECT_DOUBLE_EQ(m.advance("привет"), 48.0);
  EXPECT_DOUBLE_EQ(m.advance(""), 0.0);
}

/* ===== Геометрия ===== */

TEST_F(LayoutTest, BrickGeometry) {
  LayoutResult r = Layout({{7, "a b c"}});
  ASSERT_EQ(r.bricks.size(), 3u);

  const double xs[] = {70.0, 86.0, 102.0};
  const char* labels[] = {"a", "b", "c"};
  for (std::size_t i = 0; i < 3; ++i) {
    const auto& b = r.bricks[i];
    EXPECT_EQ(b.id, static_cast<int>(i));
    EXPECT_DOUBLE_EQ(b.rect.x, xs[i]);
    EXPECT_DOUBLE_EQ(b.rect.y, 64.0);
    EXPECT_DOUBLE_EQ(b.rect.width, 8.0);
    EXPECT_DOUBLE_EQ(b.rect.height, 18.0);
    EXPECT_EQ(b.label, labels[i]);
    EXPECT_EQ(b.source_text, "a b c");
    EXPECT_EQ(b.line_number, 7);
    EXPECT_TRUE(b.alive);
  }

  ASSERT_EQ(r.render_lines.size(), 1u);
  EXPECT_EQ(r.render_lines[0].line_number, 7);
  EXPECT_DOUBLE_EQ(r.render_lines[0].baseline_y, 76.0);
}

TEST_F(LayoutTest, RowsStackDownwards) {
  LayoutResult r = Layout({{1, "x"}, {2, "y"}});
  ASSERT_EQ(r.bricks.size(), 2u);
  EXPECT_DOUBLE_EQ(r.bricks[0].rect.y, 64.0);
  EXPECT_DOUBLE_EQ(r.bricks[1].rect.y, 82.0);
  EXPECT_DOUBLE_EQ(r.render_lines[1].baseline_y, 94.0);
}

TEST_F(LayoutTest, WhitespaceOnlyLineKeepsRow) {
  LayoutResult r = Layout({{1, "   "}, {2, "x"}});
  ASSERT_EQ(r.render_lines.size(), 2u);
  ASSERT_EQ(r.bricks.size(), 1u);
  EXPECT_EQ(r.bricks[0].line_number, 2);
  EXPECT_DOUBLE_EQ(r.bricks[0].rect.y, 82.0);
}

TEST_F(LayoutTest, LineHeightHasFloor) {
  MonospaceMetrics small(8, 10, 8);
  EXPECT_DOUBLE_EQ(codebreak::line_height(small, params), 16.0);
  EXPECT_DOUBLE_EQ(codebreak::line_height(metrics, params), 18.0);
}

TEST_F(LayoutTest, VisibleRowsLimitedByHeight) {
  // (360 - 64 - 70) / 18 = 12
  EXPECT_EQ(codebreak::visible_line_count(360, metrics, params), 12);
  LayoutResult r = Layout(NumberedLines(40));
  EXPECT_EQ(r.render_lines.size(), 12u);
  EXPECT_EQ(r.bricks.size(), 12u);
}

TEST_F(LayoutTest, AtLeastOneVisibleRow) {
  params.min_viewport_height = 1;
  EXPECT_EQ(codebreak::visible_line_count(100, metrics, params), 1);
}

TEST_F(LayoutTest, SmallViewportRaisedToMinimum) {
  LayoutResult small = Layout(NumberedLines(20), 0, 10, 10);
  LayoutResult min = Layout(NumberedLines(20), 0, 640, 360);
  ASSERT_EQ(small.bricks.size(), min.bricks.size());
  for (std::size_t i = 0; i < small.bricks.size(); ++i) {
    EXPECT_DOUBLE_EQ(small.bricks[i].rect.x, min.bricks[i].rect.x);
    EXPECT_DOUBLE_EQ(small.bricks[i].rect.y, min.bricks[i].rect.y);
  }
}

/* ===== Обрезка строки ===== */

TEST_F(LayoutTest, LongLineTruncatedWithoutWrap) {
  // правая граница 640 - 18 = 622, место под (622 - 70) / 8 = 69 символов
  std::string line;
  for (int i = 0; i < 40; ++i) line += "ab ";
  LayoutResult r = Layout({{1, line}});
  ASSERT_FALSE(r.bricks.empty());
  EXPECT_LT(r.bricks.size(), 40u);
  for (const auto& b : r.bricks) {
    EXPECT_LE(b.rect.right(), 622.0);
    EXPECT_DOUBLE_EQ(b.rect.y, 64.0);
  }
  EXPECT_EQ(r.render_lines.size(), 1u);
}

TEST_F(LayoutTest, HugeLineIsTruncated) {
  // один токен шире строки не даёт кирпичей, но строка остаётся
  LayoutResult r = Layout({{1, std::string(150000, 'x')}, {2, "a b"}});
  ASSERT_EQ(r.render_lines.size(), 2u);
  ASSERT_EQ(r.bricks.size(), 2u);
  EXPECT_EQ(r.bricks[0].line_number, 2);

  // "ab" на x = 70 + 24k, последний помещается при k = 22
  std::string line;
  for (int i = 0; i < 100000; ++i) line += "ab ";
  r = Layout({{1, line}});
  ASSERT_EQ(r.bricks.size(), 23u);
  EXPECT_DOUBLE_EQ(r.bricks.back().rect.x, 598.0);
  EXPECT_LE(r.bricks.back().rect.right(), 622.0);
}

TEST_F(LayoutTest, NarrowingNeverAddsBricks) {
  params.min_viewport_width = 1;
  const std::vector<DisplayLine> lines = {
      {1, "int main ( void ) { return compute ( 1 , 2 ) ; }"}};

  std::size_t previous = Layout(lines, 0, 2000).bricks.size();
  for (int w = 1990; w >= 60; w -= 10) {
    std::size_t count = Layout(lines, 0, w).bricks.size();
    EXPECT_LE(count, previous) << "width " << w;
    previous = count;
  }
}

TEST_F(LayoutTest, RelayoutReplacesBricks) {
  LayoutResult first = Layout({{1, "a b c"}});
  LayoutResult second = Layout({{1, "a b c"}}, 0, 1200, 800);
  ASSERT_EQ(first.bricks.size(), second.bricks.size());
  for (const auto& b : second.bricks) EXPECT_TRUE(b.alive);
}
