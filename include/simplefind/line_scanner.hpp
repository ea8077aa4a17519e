#pragma once
#include <simplefind/compiler.hpp>
#include <simplefind/file_input.hpp>
#include <simplefind/match_handler.hpp>
#include <string_view>
#include <vector>

/// Scans file contents line by line with one compiled matcher.
///
/// Lines are split on '\n'; a '\r' before the terminator is dropped and a
/// trailing terminator does not produce an extra empty line. Matches never
/// span lines.
///
/// When HyperScan's reports hide a match behind an overlapping one, the
/// rest of the line is scanned again from the end of the last kept match.
/// That scan starts a new buffer, so `^`, `\A` and `\b` see its first
/// position as the start of input.
///
/// Lines that are not valid UTF-8 are scanned with the matcher's byte mode
/// database, where columns and lengths count bytes. They are skipped when
/// the pattern has no byte mode database.
class line_scanner {
public:
  explicit line_scanner(const matcher &m);

  // Appends the matches of `file` to `results`, returns the number added
  std::size_t scan(const file_input &file, std::vector<match_result> &results,
                   std::size_t file_index = 0);

  std::vector<match_result> scan(const std::vector<file_input> &files);

  // Returns true if the line matched
  bool scan_line(std::string_view line, std::size_t line_number,
                 const std::string &path, std::vector<match_result> &results);

private:
  void find_matches(const hs_database_t *database, std::string_view line,
                    std::size_t line_number, const std::string &path);

  const matcher &pattern_matcher;
  scratch_space scratch;
  std::size_t current_file_index{0};
  std::vector<match_span> matches;
  std::vector<match_span> line_matches;
};

std::vector<match_result> scan_files(const matcher &m,
                                     const std::vector<file_input> &files);
