#pragma once
#include <optional>
#include <utility>
#include <vector>

using match_span = std::pair<unsigned long long, unsigned long long>;

struct line_context {
  std::vector<match_span> &matches;
};

int on_match(unsigned int id, unsigned long long from, unsigned long long to,
             unsigned int flags, void *ctx);

/// HyperScan reports one (from, to) pair per match end offset, carrying the
/// leftmost start for that end. Reduce them in place to non-overlapping,
/// leftmost-longest matches sorted by start offset.
///
/// A report that starts inside a kept match but ends after it may hide a
/// match starting at or after the kept match's end. The matches are then
/// cut after that kept match and its end offset is returned: the caller
/// has to scan again from there. `after_match` means the scanned buffer
/// starts right where a non-empty match ended, so an empty match at offset
/// 0 is dropped.
std::optional<unsigned long long>
select_leftmost_longest(std::vector<match_span> &matches,
                        bool after_match = false);
