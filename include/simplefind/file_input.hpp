#pragma once
#include <cstddef>
#include <string>

/// One logical file to search. The path is echoed verbatim in results.
struct file_input {
  std::string path;
  std::string content;
};

/// One match occurrence.
///
/// line and column are 1-based; column and length are counted in
/// characters (Unicode scalar values), not bytes. file_index is the
/// position of the owning file_input in the searched sequence.
struct match_result {
  std::string path;
  std::size_t line{0};
  std::size_t column{0};
  std::string line_text;
  std::size_t length{0};
  std::size_t file_index{0};
};
