#include <simplefind/line_scanner.hpp>
#include <simplefind/search.hpp>

std::vector<match_result> search(std::string_view pattern,
                                 const std::vector<file_input> &files,
                                 bool case_sensitive) {
  const auto m = compile_pattern(pattern, case_sensitive);
  return scan_files(m, files);
}

std::vector<match_result> search(std::string_view pattern,
                                 const std::vector<file_input> &files,
                                 const compile_options &options) {
  const auto m = compile_pattern(pattern, options);
  return scan_files(m, files);
}
