#pragma once
#include <simplefind/compiler.hpp>
#include <simplefind/file_input.hpp>
#include <string_view>
#include <vector>

/// Compiles `pattern` once and scans every file in input order.
///
/// Throws pattern_compile_error if the pattern is invalid, in which case
/// no file is scanned.
std::vector<match_result> search(std::string_view pattern,
                                 const std::vector<file_input> &files,
                                 bool case_sensitive);

std::vector<match_result> search(std::string_view pattern,
                                 const std::vector<file_input> &files,
                                 const compile_options &options);
