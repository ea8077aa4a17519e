#pragma once
#include <argparse/argparse.hpp>
#include <cstddef>
#include <optional>
#include <simplefind/compiler.hpp>
#include <string>
#include <vector>

struct search_options {
  bool is_stdout{true};
  bool show_line_numbers{false};
  bool show_column_numbers{false};
  bool count_matching_lines{false};
  bool count_matches{false};
  bool print_only_filenames{false};
  bool print_only_matching_parts{false};
  bool print_filenames{true};
  bool search_binary_files{false};
  std::size_t num_threads{1};
  std::optional<std::size_t> max_column_limit{};
  compile_options compile{};
  std::string pattern{};
  std::vector<std::string> paths{};
};

void add_search_arguments(argparse::ArgumentParser &program);

void initialize_search(argparse::ArgumentParser &program,
                       search_options &options);

/// Parses `arguments` (program name first) and fills `options`. Returns the
/// message to print on failure, e.g. a malformed -j or -M value.
std::optional<std::string>
parse_search_arguments(argparse::ArgumentParser &program,
                       const std::vector<std::string> &arguments,
                       search_options &options);
