#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "cb_line_source.hpp"

using codebreak::DisplayLine;
using codebreak::SourceLines;

namespace {

std::string WriteFile(const std::string& name, const std::string& content) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path;
}

}  // namespace

/* ===== Очистка строк ===== */

TEST(CollectLinesTest, StripsAndSkipsBlankLines) {
  std::vector<std::string> raw = {"", "  foo  ", "\t", "bar\r", "baz"};
  SourceLines s = codebreak::collect_lines(raw, 0);

  ASSERT_EQ(s.lines.size(), 3u);
  EXPECT_EQ(s.lines[0].line_number, 2);
  EXPECT_EQ(s.lines[0].text, "foo");
  EXPECT_EQ(s.lines[1].line_number, 4);
  EXPECT_EQ(s.lines[1].text, "bar");
  EXPECT_EQ(s.lines[2].line_number, 5);
  EXPECT_EQ(s.anchor_index, 0);
}

TEST(CollectLinesTest, AnchorSkipsForwardOverBlankLines) {
  std::vector<std::string> raw = {"", "  foo  ", "\t", "bar", "baz"};
  // курсор на пустой строке 3 (индекс 2): якорь на "bar"
  EXPECT_EQ(codebreak::collect_lines(raw, 2).anchor_index, 1);
  EXPECT_EQ(codebreak::collect_lines(raw, 4).anchor_index, 2);
}

TEST(CollectLinesTest, AnchorPastEndIsZero) {
  std::vector<std::string> raw = {"a", "b", ""};
  EXPECT_EQ(codebreak::collect_lines(raw, 2).anchor_index, 0);
  EXPECT_EQ(codebreak::collect_lines(raw, 99).anchor_index, 0);
}

TEST(CollectLinesTest, AllBlankGivesEmpty) {
  std::vector<std::string> raw = {"", "   ", "\t\t"};
  SourceLines s = codebreak::collect_lines(raw, 0);
  EXPECT_TRUE(s.lines.empty());
  EXPECT_EQ(s.anchor_index, 0);
}

/* ===== Источники ===== */

TEST(LineSourceTest, PlaceholderLines) {
  std::vector<DisplayLine> lines = codebreak::placeholder_lines();
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines.front().text, "mov eax, ebx");
  EXPECT_EQ(lines.back().text, "ret");
  for (std::size_t i = 0; i < lines.size(); ++i) {
    EXPECT_EQ(lines[i].line_number, static_cast<int>(i) + 1);
  }
}

TEST(LineSourceTest, StaticSourceReturnsSameLines) {
  codebreak::StaticLineSource src({{3, "x"}, {9, "y"}}, 1);
  for (int i = 0; i < 2; ++i) {
    SourceLines s = src.collect();
    ASSERT_EQ(s.lines.size(), 2u);
    EXPECT_EQ(s.lines[1].line_number, 9);
    EXPECT_EQ(s.anchor_index, 1);
  }
}

TEST(LineSourceTest, FileSourceMapsCursorLine) {
  const std::string path =
      WriteFile("cb_file_source.txt", "int a;\n\n  int b;\nint c;\n");
  codebreak::FileLineSource src(path, 2);
  EXPECT_EQ(src.path(), path);

  SourceLines s = src.collect();
  ASSERT_EQ(s.lines.size(), 3u);
  EXPECT_EQ(s.lines[1].line_number, 3);
  EXPECT_EQ(s.lines[1].text, "int b;");
  // строка 2 пустая, якорь на следующей непустой
  EXPECT_EQ(s.anchor_index, 1);
}

TEST(LineSourceTest, FileSourceRereadsOnEveryCollect) {
  const std::string path = WriteFile("cb_reread.txt", "one\n");
  codebreak::FileLineSource src(path, 0);
  ASSERT_EQ(src.collect().lines.size(), 1u);

  WriteFile("cb_reread.txt", "one\ntwo\nthree\n");
  SourceLines s = src.collect();
  ASSERT_EQ(s.lines.size(), 3u);
  EXPECT_EQ(s.lines[2].text, "three");
}

TEST(LineSourceTest, MissingFileGivesEmpty) {
  codebreak::FileLineSource src(::testing::TempDir() + "cb_no_such_file.txt",
                                1);
  SourceLines s = src.collect();
  EXPECT_TRUE(s.lines.empty());
}
