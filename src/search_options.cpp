#include <simplefind/search_options.hpp>
#include <exception>
#include <stdexcept>
#include <thread>
#include <unistd.h>

void add_search_arguments(argparse::ArgumentParser &program) {
  program.add_argument("-h", "--help")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-v", "--version")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("--column").default_value(false).implicit_value(true);

  program.add_argument("-c", "--count")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("--count-matches")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-F", "--fixed-strings")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-i", "--ignore-case")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-I", "--no-filename")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-l", "--files-with-matches")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-M", "--max-columns").scan<'d', std::size_t>();

  program.add_argument("-n", "--line-number")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-N", "--no-line-number")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-o", "--only-matching")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-a", "--text")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("--ucp").default_value(false).implicit_value(true);

  program.add_argument("-w", "--word-regexp")
      .default_value(false)
      .implicit_value(true);

  const auto max_concurrency = std::thread::hardware_concurrency();
  const auto default_num_threads =
      max_concurrency > 1 ? max_concurrency - 1 : 1;
  program.add_argument("-j", "--threads")
      .help("The number of threads to use")
      .default_value(default_num_threads)
      .scan<'d', unsigned>();

  program.add_argument("pattern_and_paths")
      .default_value(std::vector<std::string>{})
      .remaining();
}

void initialize_search(argparse::ArgumentParser &program,
                       search_options &options) {
  auto pattern_and_paths =
      program.get<std::vector<std::string>>("pattern_and_paths");
  if (pattern_and_paths.empty()) {
    throw std::runtime_error(
        "1 argument(s) expected for <PATTERN>. 0 provided.");
  }
  options.pattern = pattern_and_paths.front();
  options.paths.assign(pattern_and_paths.begin() + 1,
                       pattern_and_paths.end());

  options.compile.ignore_case = program.get<bool>("-i");
  options.compile.compile_pattern_as_literal = program.get<bool>("-F");
  options.compile.match_whole_words = program.get<bool>("-w");
  options.compile.use_ucp = program.get<bool>("--ucp");

  options.search_binary_files = program.get<bool>("--text");
  options.count_matching_lines = program.get<bool>("-c");
  options.count_matches = program.get<bool>("--count-matches");
  options.print_only_filenames = program.get<bool>("-l");
  options.print_only_matching_parts = program.get<bool>("-o");
  options.num_threads = program.get<unsigned>("-j");
  if (options.num_threads == 0) {
    options.num_threads = 1;
  }

  if (program.is_used("-M")) {
    options.max_column_limit = program.get<std::size_t>("-M");
  }

  // A single input is printed without its file name
  options.print_filenames =
      !program.get<bool>("-I") && options.paths.size() > 1;

  options.is_stdout = isatty(STDOUT_FILENO) == 1;

  const auto show_line_number = program.get<bool>("-n");
  const auto hide_line_number = program.get<bool>("-N");
  if (options.is_stdout) {
    // By default show line numbers
    // unless -N is used
    options.show_line_numbers = !hide_line_number;
  } else {
    // By default hide line numbers
    // unless -n is used
    options.show_line_numbers = show_line_number;
  }

  options.show_column_numbers = program.get<bool>("--column");
  if (options.show_column_numbers) {
    options.show_line_numbers = true;
  }
}

std::optional<std::string>
parse_search_arguments(argparse::ArgumentParser &program,
                       const std::vector<std::string> &arguments,
                       search_options &options) {
  try {
    program.parse_args(arguments);
    if (program.get<bool>("-h") || program.get<bool>("-v")) {
      return std::nullopt;
    }
    initialize_search(program, options);
  } catch (const std::exception &err) {
    // argparse reports bad numbers with std::invalid_argument
    return std::string{err.what()};
  }
  return std::nullopt;
}
