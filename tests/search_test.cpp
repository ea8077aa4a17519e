#include <gtest/gtest.h>
#include <simplefind/search.hpp>

namespace {

std::vector<file_input> single_file(const std::string &content) {
  return {file_input{"test.txt", content}};
}

} // namespace

TEST(SearchTest, BasicMatch) {
  const auto results = search("world", single_file("Hello, world!"), true);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].path, "test.txt");
  EXPECT_EQ(results[0].line, 1u);
  EXPECT_EQ(results[0].column, 8u);
  EXPECT_EQ(results[0].line_text, "Hello, world!");
  EXPECT_EQ(results[0].length, 5u);
}

TEST(SearchTest, NoMatch) {
  EXPECT_TRUE(search("foo", single_file("Hello, world!"), true).empty());
}

TEST(SearchTest, CaseInsensitiveMatch) {
  const auto results = search("world", single_file("Hello, WORLD!"), false);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 8u);
  EXPECT_EQ(results[0].line_text, "Hello, WORLD!");
}

TEST(SearchTest, CaseSensitiveMismatch) {
  EXPECT_TRUE(search("world", single_file("Hello, WORLD!"), true).empty());
}

TEST(SearchTest, CaseInsensitiveDoesNotRewritePattern) {
  // Character classes fold too
  const auto results = search("[a-c]+X", single_file("zzABCx"), false);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 3u);
  EXPECT_EQ(results[0].length, 4u);
}

TEST(SearchTest, MultilineFile) {
  const auto results = search("Line", single_file("Line 1\nLine 2\nLine 3"),
                              true);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].line, 1u);
  EXPECT_EQ(results[1].line, 2u);
  EXPECT_EQ(results[2].line, 3u);
  EXPECT_EQ(results[2].line_text, "Line 3");
}

TEST(SearchTest, MultipleFiles) {
  const std::vector<file_input> files{{"file1.txt", "Hello from file1"},
                                      {"file2.txt", "Hello from file2"}};
  const auto results = search("Hello", files, true);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].path, "file1.txt");
  EXPECT_EQ(results[1].path, "file2.txt");
}

TEST(SearchTest, MultipleMatchesOnTheSameLine) {
  const auto results = search("foo", single_file("foo bar foo baz"), true);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].column, 1u);
  EXPECT_EQ(results[1].column, 9u);
  EXPECT_EQ(results[0].line, results[1].line);
  EXPECT_EQ(results[0].line_text, results[1].line_text);
}

TEST(SearchTest, RegexPattern) {
  const auto results = search("\\d+", single_file("abc123 def456"), true);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].column, 4u);
  EXPECT_EQ(results[0].length, 3u);
  EXPECT_EQ(results[1].column, 11u);
  EXPECT_EQ(results[1].length, 3u);
  EXPECT_EQ(results[0].line_text, "abc123 def456");
  EXPECT_EQ(results[1].line_text, "abc123 def456");
}

TEST(SearchTest, InvalidPatternScansNothing) {
  // The sentinel would match any non-empty pattern
  const std::vector<file_input> files{{"sentinel.txt", "(((((\n[[[[["}};
  std::vector<match_result> results;
  EXPECT_THROW(results = search("[", files, true), pattern_compile_error);
  EXPECT_THROW(results = search("(", files, false), pattern_compile_error);
  EXPECT_TRUE(results.empty());
}

TEST(SearchTest, InvalidPatternMessageIsDescriptive) {
  try {
    search("a(b", single_file("a(b"), true);
    FAIL() << "expected pattern_compile_error";
  } catch (const pattern_compile_error &err) {
    EXPECT_EQ(err.pattern(), "a(b");
    EXPECT_NE(std::string(err.what()).find("a(b"), std::string::npos);
  }
}

TEST(SearchTest, EmptyFile) {
  EXPECT_TRUE(search("test", single_file(""), true).empty());
}

TEST(SearchTest, EmptyFileWithEmptyPattern) {
  EXPECT_TRUE(search("", single_file(""), true).empty());
}

TEST(SearchTest, NoFiles) { EXPECT_TRUE(search("x", {}, true).empty()); }

TEST(SearchTest, EmptyPatternMatchesEveryPosition) {
  // 13 characters, 14 positions
  const auto results = search("", single_file("Hello, world!"), true);
  ASSERT_EQ(results.size(), 14u);
  for (std::size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].column, i + 1);
    EXPECT_EQ(results[i].length, 0u);
  }
}

TEST(SearchTest, ColumnPosition) {
  const auto results = search("Hello", single_file("  Hello"), true);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 3u);
}

TEST(SearchTest, ResultsFollowFileThenLineThenColumnOrder) {
  const std::vector<file_input> files{{"a.txt", "x.x\n..\nx"},
                                      {"b.txt", ""},
                                      {"c.txt", "..x\nxx"},
                                      {"d.txt", "x"}};
  const auto results = search("x", files, true);

  struct location {
    std::string path;
    std::size_t line;
    std::size_t column;
  };
  const std::vector<location> expected{{"a.txt", 1, 1}, {"a.txt", 1, 3},
                                       {"a.txt", 3, 1}, {"c.txt", 1, 3},
                                       {"c.txt", 2, 1}, {"c.txt", 2, 2},
                                       {"d.txt", 1, 1}};
  ASSERT_EQ(results.size(), expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(results[i].path, expected[i].path) << "result " << i;
    EXPECT_EQ(results[i].line, expected[i].line) << "result " << i;
    EXPECT_EQ(results[i].column, expected[i].column) << "result " << i;
  }
}

TEST(SearchTest, LineTextRescanReproducesColumn) {
  const std::vector<file_input> files{
      {"a.txt", "int main() {\n  return foo(bar);\n}\n"},
      {"b.txt", "foo\r\nbarfoo bar\n\xC3\xA9t\xC3\xA9 foo"}};
  for (const auto &result : search("foo|bar", files, true)) {
    const auto rescanned =
        search("foo|bar", single_file(result.line_text), true);
    bool found{false};
    for (const auto &other : rescanned) {
      EXPECT_EQ(other.line, 1u);
      if (other.column == result.column) {
        found = true;
      }
    }
    EXPECT_TRUE(found) << result.path << ":" << result.line << ":"
                       << result.column;
  }
}

TEST(SearchTest, FixedStringOption) {
  compile_options options;
  options.compile_pattern_as_literal = true;
  const auto results = search("a.b", single_file("axb a.b"), options);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 5u);
}

TEST(SearchTest, FixedStringOptionWithIgnoreCase) {
  compile_options options;
  options.compile_pattern_as_literal = true;
  options.ignore_case = true;
  const auto results = search("(X)", single_file("(x) (X)"), options);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].column, 5u);
}

TEST(SearchTest, EmbeddedNulPatternScansNothing) {
  std::vector<match_result> results;
  EXPECT_THROW(results = search(std::string("foo\0bar", 7),
                                single_file("foo"), true),
               pattern_compile_error);
  EXPECT_TRUE(results.empty());
}

TEST(SearchTest, FixedStringWithNul) {
  compile_options options;
  options.compile_pattern_as_literal = true;
  const auto results = search(std::string("a\0b", 3),
                              single_file(std::string("xa\0b", 4)), options);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 2u);
}

TEST(SearchTest, WholeWordOption) {
  compile_options options;
  options.match_whole_words = true;
  const auto results = search("foo", single_file("foobar foo barfoo"), options);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 8u);
}

TEST(SearchTest, WholeWordFixedString) {
  compile_options options;
  options.match_whole_words = true;
  options.compile_pattern_as_literal = true;
  const auto results = search("a.b", single_file("a.bc axb a.b"), options);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].column, 10u);
}
