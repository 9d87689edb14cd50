#pragma once

// verso/diff.hpp - Line-level diff engine.
//
// ALGORITHM:
//   Myers' O(N*D) greedy forward search ("An O(ND) Difference Algorithm and
//   Its Variations", 1986) over the section left after stripping the common
//   prefix and suffix. The trace keeps only the live diagonal window of each
//   round, so memory is O(D^2) rather than O((N+M)*D).
//
// DETERMINISM GUARANTEES:
//   1. Identical inputs always produce identical output.
//   2. Among minimal edit scripts, the one with the longest leading unchanged
//      run is chosen, then the one with the longest trailing unchanged run
//      (prefix stripped first, suffix second).
//   3. diff(a, b) and diff(b, a) match exactly the same line pairs. The middle
//      search always runs on a canonical ordering of its two inputs and the
//      script is mirrored back when the inputs were swapped. This is what
//      makes additions(a->b) == deletions(b->a).
//   4. Within a change hunk holding d deletions and a additions, the first
//      min(d, a) pairs collapse into Modify entries. A changed line counts
//      once, as a modification.
//
// THREAD SAFETY:
//   Every function here is pure. No shared state, no I/O.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "verso/types.hpp"

namespace verso {

// Replace "\r\n" and lone "\r" with "\n".
std::string normalize_line_endings(std::string_view text);

// Split normalized text on every '\n'. "" yields no lines; a trailing newline
// yields a final empty line, so "a" and "a\n" differ.
std::vector<std::string> split_lines(std::string_view text);

// Inverse of split_lines() for any normalized text.
std::string join_lines(const std::vector<std::string>& lines);

// The Myers trace costs O(D^2) memory, so every comparison path is bounded.
inline constexpr std::size_t kDefaultMaxEditDistance = 2000;

struct DiffLimits {
  std::size_t max_lines{20000};              // per side
  std::size_t max_bytes{8u * 1024u * 1024u}; // per side
  // Myers D bound. compare_lines() treats 0 as kDefaultMaxEditDistance.
  std::size_t max_edit_distance{kDefaultMaxEditDistance};
};

struct DiffOutcome {
  std::vector<DiffEntry> entries;
  // True when the edit distance exceeded max_edit_distance. entries is empty.
  bool truncated{false};
  std::size_t edit_distance{0};  // insertions + deletions before collapsing
};

// Full diff with no bound on edit distance. Memory grows with the square of
// the edit distance; untrusted input goes through compare_lines() instead.
std::vector<DiffEntry> diff(const std::vector<std::string>& old_lines,
                            const std::vector<std::string>& new_lines);

// Diff that gives up once the edit distance passes max_edit_distance
// (0 = unbounded).
DiffOutcome diff_bounded(const std::vector<std::string>& old_lines,
                         const std::vector<std::string>& new_lines,
                         std::size_t max_edit_distance);

}  // namespace verso
