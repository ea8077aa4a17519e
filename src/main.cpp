#include <cstdio>
#include <fmt/format.h>
#include <exception>
#include <iostream>
#include <simplefind/constants.hpp>
#include <simplefind/file_loader.hpp>
#include <simplefind/output.hpp>
#include <simplefind/parallel_search.hpp>
#include <simplefind/print_help.hpp>
#include <simplefind/search.hpp>
#include <simplefind/search_options.hpp>
#include <unistd.h>

namespace {

// Exit codes follow grep: 0 matched, 1 no match, 2 error
constexpr int EXIT_MATCH = 0;
constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_ERROR = 2;

std::vector<file_input> load_inputs(const search_options &options,
                                    bool &load_error) {
  std::vector<file_input> files;
  if (options.paths.empty()) {
    files.push_back(load_stream(std::cin, std::string{STDIN_PATH}));
    return files;
  }

  files.reserve(options.paths.size());
  for (const auto &path : options.paths) {
    auto file = load_file(path);
    if (!file.has_value()) {
      load_error = true;
    } else if (options.search_binary_files || !is_binary(file->content)) {
      files.push_back(std::move(file.value()));
    }
  }
  return files;
}

} // namespace

int main(int argc, char **argv) {

  argparse::ArgumentParser program(std::string{NAME}, VERSION.data(),
                                   argparse::default_arguments::none);
  add_search_arguments(program);

  search_options options;
  const auto parse_error = parse_search_arguments(
      program, std::vector<std::string>(argv, argv + argc), options);
  if (parse_error.has_value()) {
    std::cerr << parse_error.value() << std::endl;
    std::cerr << "\nFor more information try --help\n";
    return EXIT_ERROR;
  }

  if (program.get<bool>("-h")) {
    print_help();
    return EXIT_MATCH;
  } else if (program.get<bool>("-v")) {
    fmt::print("{}\n", VERSION);
    return EXIT_MATCH;
  }

  if (options.paths.empty() && isatty(fileno(stdin))) {
    std::cerr << "No PATH provided and standard input is a terminal\n";
    std::cerr << "\nFor more information try --help\n";
    return EXIT_ERROR;
  }

  bool load_error{false};
  const auto files = load_inputs(options, load_error);

  std::vector<match_result> results;
  try {
    if (options.num_threads > 1 && files.size() > 1) {
      const auto m = compile_pattern(options.pattern, options.compile);
      results = search_parallel(m, files, options.num_threads);
    } else {
      results = search(options.pattern, files, options.compile);
    }
  } catch (const std::exception &err) {
    // pattern_compile_error messages are printed verbatim
    std::cerr << err.what() << std::endl;
    return EXIT_ERROR;
  }

  fmt::print("{}", format_results(results, options));

  if (load_error) {
    return EXIT_ERROR;
  }
  return results.empty() ? EXIT_NO_MATCH : EXIT_MATCH;
}
