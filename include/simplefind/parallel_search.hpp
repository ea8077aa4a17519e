#pragma once
#include <simplefind/compiler.hpp>
#include <simplefind/file_input.hpp>
#include <vector>

/// Scans files on `num_threads` worker threads. The result is identical to
/// scan_files(m, files): grouped by input file order, then line, then column.
std::vector<match_result> search_parallel(const matcher &m,
                                          const std::vector<file_input> &files,
                                          std::size_t num_threads);
