#include <fmt/color.h>
#include <fmt/format.h>
#include <simplefind/constants.hpp>
#include <simplefind/print_help.hpp>
#include <string_view>
#include <unistd.h>

namespace {

void print_heading(bool is_stdout, std::string_view name) {
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "{}\n", name);
  } else {
    fmt::print("{}\n", name);
  }
}

void print_option_name(bool is_stdout, std::string_view name,
                       std::string_view arg_placeholder = "") {
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "    {}", name);
  } else {
    fmt::print("    {}", name);
  }
  if (arg_placeholder.empty()) {
    fmt::print("\n");
  } else {
    fmt::print(" {}\n", arg_placeholder);
  }
}

void print_description_line(std::string_view line) {
  fmt::print("        {}\n", line);
}

void print_synopsis(bool is_stdout, std::string_view arguments) {
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "    {}", NAME);
  } else {
    fmt::print("    {}", NAME);
  }
  fmt::print(" [");
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "OPTIONS");
  } else {
    fmt::print("OPTIONS");
  }
  fmt::print("] ");
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "{}", arguments);
  } else {
    fmt::print("{}", arguments);
  }
  fmt::print("\n");
}

} // namespace

void print_help() {
  const auto is_stdout = isatty(STDOUT_FILENO) == 1;

  // Name
  print_heading(is_stdout, "NAME");
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "    {}", NAME);
  } else {
    fmt::print("    {}", NAME);
  }
  fmt::print(" - {}\n\n", DESCRIPTION);

  // Synopsis
  print_heading(is_stdout, "SYNOPSIS");
  print_synopsis(is_stdout, "PATTERN PATH [PATH ...]");
  print_synopsis(is_stdout, "PATTERN < FILE");
  print_synopsis(is_stdout, "--help");
  print_synopsis(is_stdout, "--version");
  fmt::print("\n");

  // Description
  print_heading(is_stdout, "DESCRIPTION");
  fmt::print("    Each PATH is read into memory in full and searched line by "
             "line.\n");
  fmt::print("    Directories are not traversed. Matches never span more than "
             "one line.\n\n");

  // Pattern
  print_heading(is_stdout, "PATTERN");
  print_option_name(false, "A regular expression used for searching. An empty");
  print_option_name(false, "pattern matches at every position of every line.\n");

  // Path
  print_heading(is_stdout, "PATH");
  print_option_name(false, "A file to search. If no path is provided, standard");
  print_option_name(false, "input is searched when it is not a terminal.\n");

  // Options
  print_heading(is_stdout, "OPTIONS");

  // Column
  print_option_name(is_stdout, "--column");
  print_description_line(
      "Show column numbers (1-based, counted in characters). This only shows");
  print_description_line(
      "the column of the first match on each line unless -o is used.\n");

  // Count
  print_option_name(is_stdout, "-c, --count");
  print_description_line(
      "This flag suppresses normal output and shows the number of");
  print_description_line(
      "lines that match the given pattern for each file searched\n");

  // Count Matches
  print_option_name(is_stdout, "--count-matches");
  print_description_line(
      "This flag suppresses normal output and shows the number of");
  print_description_line(
      "individual matches of the given pattern for each file searched\n");

  // Fixed Strings
  print_option_name(is_stdout, "-F, --fixed-strings");
  print_description_line(
      "Treat the pattern as a literal string instead of a regex.");
  print_description_line(
      "Special regex meta characters such as .(){}*+ do not need");
  print_description_line("to be escaped.\n");

  // Help
  print_option_name(is_stdout, "-h, --help");
  print_description_line("Display this help message.\n");

  // Ignore case
  print_option_name(is_stdout, "-i, --ignore-case");
  print_description_line(
      "When this flag is provided, the given pattern will be searched");
  print_description_line("case insensitively.\n");

  // No filename
  print_option_name(is_stdout, "-I, --no-filename");
  print_description_line(
      "Never print the file path with the matched lines. This is the");
  print_description_line("default when searching one file or stdin.\n");

  // Files with matches
  print_option_name(is_stdout, "-l, --files-with-matches");
  print_description_line(
      "Print the paths with at least one match and suppress match contents.\n");

  // Threads
  print_option_name(is_stdout, "-j, --threads", "<NUM>");
  print_description_line(
      "The number of threads used to search files. Output order is the");
  print_description_line("same as with a single thread.\n");

  // Max columns
  print_option_name(is_stdout, "-M, --max-columns", "<NUM>");
  print_description_line(
      "Don't print lines longer than this limit in bytes. Longer lines are");
  print_description_line(
      "omitted, and only the number of matches in that line is printed.\n");

  // Line Number
  print_option_name(is_stdout, "-n, --line-number");
  print_description_line("Show line numbers (1-based). This is enabled by "
                         "default when searching");
  print_description_line("in a terminal.\n");

  // No Line Number
  print_option_name(is_stdout, "-N, --no-line-number");
  print_description_line("Suppress line numbers. This is enabled by default "
                         "when not searching in");
  print_description_line("a terminal.\n");

  // Only matching parts
  print_option_name(is_stdout, "-o, --only-matching");
  print_description_line(
      "Print only matched parts of a matching line, with each such part on a");
  print_description_line("separate output line.\n");

  // Binary as text
  print_option_name(is_stdout, "-a, --text");
  print_description_line(
      "Search binary files as if they were text. When this flag is present,");
  print_description_line("binary file detection is disabled.\n");

  // UCP
  print_option_name(is_stdout, "--ucp");
  print_description_line(
      "Use unicode properties, rather than the default ASCII interpretations,");
  print_description_line(
      "for character mnemonics like \\w and \\s as well as the POSIX");
  print_description_line("character classes.\n");

  // Version
  print_option_name(is_stdout, "-v, --version");
  print_description_line("Display the version information.\n");

  // Word
  print_option_name(is_stdout, "-w, --word-regexp");
  print_description_line(
      "Only show matches surrounded by word boundaries. This is equivalent to");
  print_description_line(
      "putting \\b before and after the search pattern.\n");
}
