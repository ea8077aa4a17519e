#pragma once
#include <simplefind/file_input.hpp>
#include <simplefind/search_options.hpp>
#include <string>
#include <vector>

/// Renders search results the way `sf` prints them. Colors are only used
/// when options.is_stdout is set. Results are grouped per input file by
/// match_result::file_index, so inputs sharing a path are kept apart.
std::string format_results(const std::vector<match_result> &results,
                           const search_options &options);
