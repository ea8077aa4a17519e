#include <fmt/format.h>
#include <limits>
#include <simplefind/line_scanner.hpp>
#include <simplefind/utf8.hpp>

line_scanner::line_scanner(const matcher &m)
    : pattern_matcher(m), scratch(m) {}

std::size_t line_scanner::scan(const file_input &file,
                               std::vector<match_result> &results,
                               std::size_t file_index) {
  const auto previous_size = results.size();
  current_file_index = file_index;
  std::string_view content(file.content);

  std::size_t current_line_number{1};
  std::size_t start_of_line{0};
  while (start_of_line < content.size()) {
    auto end_of_line = content.find('\n', start_of_line);
    auto next_line = end_of_line;
    if (end_of_line == std::string_view::npos) {
      end_of_line = content.size();
      next_line = content.size();
    } else {
      next_line += 1;
    }

    auto line = content.substr(start_of_line, end_of_line - start_of_line);
    if (end_of_line != content.size() && !line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    scan_line(line, current_line_number, file.path, results);

    current_line_number += 1;
    start_of_line = next_line;
  }

  return results.size() - previous_size;
}

std::vector<match_result>
line_scanner::scan(const std::vector<file_input> &files) {
  std::vector<match_result> results;
  for (std::size_t i = 0; i < files.size(); ++i) {
    scan(files[i], results, i);
  }
  return results;
}

bool line_scanner::scan_line(std::string_view line,
                             std::size_t line_number, const std::string &path,
                             std::vector<match_result> &results) {
  // hs_scan takes an `unsigned int` buffer size
  if (line.size() > std::numeric_limits<unsigned int>::max()) {
    throw std::runtime_error(
        fmt::format("{}:{}: line too long to scan", path, line_number));
  }

  const bool valid_utf8 = is_valid_utf8(line);
  const auto *database = valid_utf8 ? pattern_matcher.database()
                                    : pattern_matcher.byte_database();
  if (!database) {
    return false;
  }

  find_matches(database, line, line_number, path);
  if (line_matches.empty()) {
    return false;
  }

  const auto count = [valid_utf8](std::string_view text) {
    return valid_utf8 ? utf8_length(text) : text.size();
  };

  const std::string line_text{line};
  std::size_t index{0};
  std::size_t column{1};
  for (const auto &[from, to] : line_matches) {
    column += count(line.substr(index, from - index));
    index = from;
    results.push_back(match_result{path, line_number, column, line_text,
                                   count(line.substr(from, to - from)),
                                   current_file_index});
  }

  return true;
}

void line_scanner::find_matches(const hs_database_t *database,
                                std::string_view line,
                                std::size_t line_number,
                                const std::string &path) {
  line_matches.clear();

  std::size_t offset{0};
  bool after_match{false};
  while (true) {
    const auto rest = line.substr(offset);

    matches.clear();
    line_context ctx{matches};
    if (hs_scan(database, rest.data(), static_cast<unsigned int>(rest.size()),
                0, scratch.get(), on_match, (void *)(&ctx)) != HS_SUCCESS) {
      throw std::runtime_error(
          fmt::format("{}:{}: error scanning line", path, line_number));
    }

    const auto resume_at = select_leftmost_longest(matches, after_match);
    for (const auto &[from, to] : matches) {
      line_matches.emplace_back(from + offset, to + offset);
    }

    if (!resume_at.has_value()) {
      break;
    }
    offset += resume_at.value();
    after_match = true;
  }
}

std::vector<match_result> scan_files(const matcher &m,
                                     const std::vector<file_input> &files) {
  line_scanner scanner(m);
  return scanner.scan(files);
}
