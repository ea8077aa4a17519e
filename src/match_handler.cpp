#include <algorithm>
#include <hs/hs.h>
#include <simplefind/match_handler.hpp>

int on_match(unsigned int id, unsigned long long from, unsigned long long to,
             unsigned int flags, void *ctx) {
  line_context *lctx = (line_context *)(ctx);
  lctx->matches.push_back(std::make_pair(from, to));
  return HS_SUCCESS;
}

std::optional<unsigned long long>
select_leftmost_longest(std::vector<match_span> &matches, bool after_match) {
  // Earliest start first; for the same start, the longest match first
  std::sort(matches.begin(), matches.end(),
            [](const match_span &lhs, const match_span &rhs) {
              return lhs.first < rhs.first ||
                     (lhs.first == rhs.first && lhs.second > rhs.second);
            });

  std::size_t kept{0};
  for (std::size_t i = 0; i < matches.size(); ++i) {
    const auto [from, to] = matches[i];

    if (kept == 0) {
      if (after_match && from == 0 && to == 0) {
        continue;
      }
    } else {
      const auto most_recent_match = matches[kept - 1];

      // Case 1: Same start, the longest one is already kept
      if (from == most_recent_match.first) {
        continue;
      }

      // Case 2: Starts inside the previous match
      if (from < most_recent_match.second) {
        if (to > most_recent_match.second) {
          // Case 2b: The end offset may belong to a later match whose start
          // HyperScan did not report
          matches.resize(kept);
          return most_recent_match.second;
        }
        continue;
      }

      // Case 3: Empty match right where a non-empty match ended
      if (from == to && from == most_recent_match.second &&
          most_recent_match.first != most_recent_match.second) {
        continue;
      }
    }

    matches[kept++] = matches[i];
  }
  matches.resize(kept);
  return std::nullopt;
}
