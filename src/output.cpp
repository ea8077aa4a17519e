#include <algorithm>
#include <fmt/color.h>
#include <fmt/format.h>
#include <iterator>
#include <simplefind/output.hpp>
#include <simplefind/utf8.hpp>
#include <string_view>
#include <utility>

namespace {

using match_iterator = std::vector<match_result>::const_iterator;

std::string format_filename(const std::string &path,
                            const search_options &options) {
  if (options.is_stdout) {
    return fmt::format(fg(fmt::color::steel_blue), "{}", path);
  }
  return path;
}

// Line and column prefix of an output line, with the file name in front
// when the output is not a terminal
std::string format_prefix(const match_result &match,
                          const search_options &options) {
  std::string prefix{};
  if (!options.is_stdout && options.print_filenames) {
    prefix += fmt::format("{}:", match.path);
  }
  if (options.show_line_numbers) {
    if (options.is_stdout) {
      prefix += fmt::format(fg(fmt::color::green), "{}:", match.line);
    } else {
      prefix += fmt::format("{}:", match.line);
    }
    if (options.show_column_numbers) {
      prefix += fmt::format("{}:", match.column);
    }
  }
  return prefix;
}

std::string format_match_text(std::string_view text,
                              const search_options &options) {
  if (options.is_stdout) {
    return fmt::format(fg(fmt::color::red), "{}", text);
  }
  return std::string{text};
}

// Byte range of a match within its line. Columns count bytes on lines that
// are not valid UTF-8.
std::pair<std::size_t, std::size_t> match_bytes(std::string_view line_text,
                                                const match_result &match) {
  if (!is_valid_utf8(line_text)) {
    const auto from = std::min(match.column - 1, line_text.size());
    return {from, std::min(from + match.length, line_text.size())};
  }
  const auto from = utf8_byte_offset(line_text, match.column - 1);
  return {from, from + utf8_byte_offset(line_text.substr(from), match.length)};
}

// Formats the matches [first, last) which all belong to the same line
std::string format_line(match_iterator first, match_iterator last,
                        const search_options &options) {
  std::string lines{};
  const std::string_view line_text(first->line_text);
  const auto number_of_matches = std::distance(first, last);

  if (options.max_column_limit.has_value() &&
      line_text.size() > options.max_column_limit.value()) {
    // with line number: 12:[Omitted long line with 2 matches]
    auto prefix = format_prefix(*first, options);
    lines += fmt::format("{}[Omitted long line with {} matches]\n", prefix,
                         number_of_matches);
    return lines;
  }

  if (options.print_only_matching_parts) {
    for (auto it = first; it != last; ++it) {
      const auto [from, to] = match_bytes(line_text, *it);
      lines += format_prefix(*it, options);
      lines += format_match_text(line_text.substr(from, to - from), options);
      lines += "\n";
    }
    return lines;
  }

  // Only the first match of a line shows its column
  lines += format_prefix(*first, options);

  std::size_t index{0};
  for (auto it = first; it != last; ++it) {
    const auto [from, to] = match_bytes(line_text, *it);
    lines += line_text.substr(index, from - index);
    lines += format_match_text(line_text.substr(from, to - from), options);
    index = to;
  }
  lines += line_text.substr(index);
  lines += "\n";
  return lines;
}

// Formats all matches [first, last) of one file
std::string format_file(match_iterator first, match_iterator last,
                        const search_options &options) {
  const auto &path = first->path;

  if (options.print_only_filenames) {
    return format_filename(path, options) + "\n";
  }

  if (options.count_matching_lines || options.count_matches) {
    std::size_t count{0};
    if (options.count_matches) {
      count = static_cast<std::size_t>(std::distance(first, last));
    } else {
      for (auto it = first; it != last; ++it) {
        if (it == first || it->line != std::prev(it)->line) {
          count += 1;
        }
      }
    }
    if (options.print_filenames) {
      return fmt::format("{}:{}\n", format_filename(path, options), count);
    }
    return fmt::format("{}\n", count);
  }

  std::string lines{};
  if (options.is_stdout && options.print_filenames) {
    lines += format_filename(path, options) + "\n";
  }

  auto start_of_line = first;
  while (start_of_line != last) {
    auto end_of_line = start_of_line;
    while (end_of_line != last && end_of_line->line == start_of_line->line) {
      ++end_of_line;
    }
    lines += format_line(start_of_line, end_of_line, options);
    start_of_line = end_of_line;
  }

  if (options.is_stdout) {
    lines += "\n";
  }
  return lines;
}

} // namespace

std::string format_results(const std::vector<match_result> &results,
                           const search_options &options) {
  std::string output{};
  auto first = results.begin();
  while (first != results.end()) {
    auto last = first;
    while (last != results.end() && last->file_index == first->file_index) {
      ++last;
    }
    output += format_file(first, last, options);
    first = last;
  }
  return output;
}
