#include "verso/diff.hpp"

// Myers forward search with a compact trace.
//
// The trace stores, for each round d, the furthest-reaching x of every
// diagonal k in [-(d+1), d+1] as it stood before round d ran. Backtracking
// walks the rounds in reverse and re-derives which neighbour diagonal each
// round extended, exactly as the forward pass decided it.
//
// Tie-break inside the search: on equal furthest reach the round extends from
// diagonal k-1 (a deletion) rather than k+1 (an insertion).

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace verso {

namespace {

struct LineRange {
  const std::string* base{nullptr};
  std::size_t size{0};
  const std::string& operator[](std::size_t i) const { return base[i]; }
};

enum class Op : uint8_t { keep, del, ins };

struct Step {
  Op op;
  std::size_t x;  // index into the old range (keep, del)
  std::size_t y;  // index into the new range (keep, ins)
};

struct Round {
  std::ptrdiff_t d;
  std::vector<std::ptrdiff_t> reach;  // index = k + d + 1

  std::ptrdiff_t at(std::ptrdiff_t k) const {
    return reach[static_cast<std::size_t>(k + d + 1)];
  }
};

// Returns false when the bound was hit before both ranges were consumed.
bool myers(const LineRange& a, const LineRange& b, std::size_t bound,
           std::vector<Step>& out) {
  const auto n = static_cast<std::ptrdiff_t>(a.size);
  const auto m = static_cast<std::ptrdiff_t>(b.size);
  const std::ptrdiff_t max = n + m;
  const std::ptrdiff_t limit =
      bound == 0 ? max : std::min<std::ptrdiff_t>(max, static_cast<std::ptrdiff_t>(bound));

  const std::ptrdiff_t offset = max + 1;
  std::vector<std::ptrdiff_t> v(static_cast<std::size_t>(2 * max + 3), 0);
  std::vector<Round> trace;

  bool reached = false;
  std::ptrdiff_t final_d = 0;
  for (std::ptrdiff_t d = 0; d <= limit && !reached; ++d) {
    Round r;
    r.d = d;
    r.reach.assign(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
    trace.push_back(std::move(r));

    for (std::ptrdiff_t k = -d; k <= d; k += 2) {
      std::ptrdiff_t x;
      if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1])) {
        x = v[offset + k + 1];
      } else {
        x = v[offset + k - 1] + 1;
      }
      std::ptrdiff_t y = x - k;
      while (x < n && y < m && a[static_cast<std::size_t>(x)] == b[static_cast<std::size_t>(y)]) {
        ++x;
        ++y;
      }
      v[offset + k] = x;
      if (x >= n && y >= m) {
        reached = true;
        final_d = d;
        break;
      }
    }
  }
  if (!reached) return false;

  std::vector<Step> rev;
  std::ptrdiff_t x = n;
  std::ptrdiff_t y = m;
  for (std::ptrdiff_t d = final_d; d >= 0; --d) {
    const Round& r = trace[static_cast<std::size_t>(d)];
    const std::ptrdiff_t k = x - y;
    std::ptrdiff_t prev_k;
    if (k == -d || (k != d && r.at(k - 1) < r.at(k + 1))) {
      prev_k = k + 1;
    } else {
      prev_k = k - 1;
    }
    const std::ptrdiff_t prev_x = d == 0 ? 0 : r.at(prev_k);
    const std::ptrdiff_t prev_y = d == 0 ? 0 : prev_x - prev_k;

    while (x > prev_x && y > prev_y) {
      rev.push_back({Op::keep, static_cast<std::size_t>(x - 1), static_cast<std::size_t>(y - 1)});
      --x;
      --y;
    }
    if (d > 0) {
      if (x == prev_x) {
        rev.push_back({Op::ins, static_cast<std::size_t>(prev_x), static_cast<std::size_t>(prev_y)});
      } else {
        rev.push_back({Op::del, static_cast<std::size_t>(prev_x), static_cast<std::size_t>(prev_y)});
      }
    }
    x = prev_x;
    y = prev_y;
  }

  out.assign(rev.rbegin(), rev.rend());
  return true;
}

void flush_hunk(const LineRange& a, const LineRange& b, std::size_t base,
                std::vector<std::size_t>& dels, std::vector<std::size_t>& ins,
                std::vector<DiffEntry>& out) {
  const std::size_t pairs = std::min(dels.size(), ins.size());
  for (std::size_t i = 0; i < pairs; ++i) {
    out.emplace_back(ModifiedLine{base + dels[i] + 1, base + ins[i] + 1,
                                  a[dels[i]], b[ins[i]]});
  }
  for (std::size_t i = pairs; i < dels.size(); ++i) {
    out.emplace_back(DeletedLine{base + dels[i] + 1, a[dels[i]]});
  }
  for (std::size_t i = pairs; i < ins.size(); ++i) {
    out.emplace_back(AddedLine{base + ins[i] + 1, b[ins[i]]});
  }
  dels.clear();
  ins.clear();
}

}  // namespace

std::string normalize_line_endings(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\r') {
      out += '\n';
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    } else {
      out += c;
    }
  }
  return out;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  if (text.empty()) return lines;
  std::size_t start = 0;
  for (;;) {
    const std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out += '\n';
    out += lines[i];
  }
  return out;
}

std::vector<DiffEntry> diff(const std::vector<std::string>& old_lines,
                            const std::vector<std::string>& new_lines) {
  return diff_bounded(old_lines, new_lines, 0).entries;
}

DiffOutcome diff_bounded(const std::vector<std::string>& old_lines,
                         const std::vector<std::string>& new_lines,
                         std::size_t max_edit_distance) {
  DiffOutcome outcome;
  const std::size_t n = old_lines.size();
  const std::size_t m = new_lines.size();

  std::size_t prefix = 0;
  while (prefix < n && prefix < m && old_lines[prefix] == new_lines[prefix]) ++prefix;
  std::size_t suffix = 0;
  while (suffix < n - prefix && suffix < m - prefix &&
         old_lines[n - 1 - suffix] == new_lines[m - 1 - suffix]) {
    ++suffix;
  }

  const LineRange a{old_lines.data() + prefix, n - prefix - suffix};
  const LineRange b{new_lines.data() + prefix, m - prefix - suffix};

  std::vector<Step> steps;
  if (a.size == 0 || b.size == 0) {
    // Pure insertion or deletion: linear, never bounded.
    for (std::size_t i = 0; i < a.size; ++i) steps.push_back({Op::del, i, 0});
    for (std::size_t j = 0; j < b.size; ++j) steps.push_back({Op::ins, 0, j});
  } else {
    const std::size_t gap = a.size > b.size ? a.size - b.size : b.size - a.size;
    if (max_edit_distance != 0 && gap > max_edit_distance) {
      outcome.truncated = true;
      outcome.edit_distance = gap;
      return outcome;
    }
    // Canonical orientation: the lexicographically smaller range goes first.
    const bool swapped = std::lexicographical_compare(
        b.base, b.base + b.size, a.base, a.base + a.size);
    const bool found = swapped ? myers(b, a, max_edit_distance, steps)
                               : myers(a, b, max_edit_distance, steps);
    if (!found) {
      outcome.truncated = true;
      outcome.edit_distance = max_edit_distance + 1;
      return outcome;
    }
    if (swapped) {
      for (Step& s : steps) {
        std::swap(s.x, s.y);
        if (s.op == Op::del) {
          s.op = Op::ins;
        } else if (s.op == Op::ins) {
          s.op = Op::del;
        }
      }
    }
  }

  auto& out = outcome.entries;
  out.reserve(prefix + steps.size() + suffix);
  for (std::size_t i = 0; i < prefix; ++i) {
    out.emplace_back(UnchangedLine{i + 1, i + 1, old_lines[i]});
  }

  std::vector<std::size_t> dels;
  std::vector<std::size_t> ins;
  for (const Step& s : steps) {
    switch (s.op) {
      case Op::keep:
        flush_hunk(a, b, prefix, dels, ins, out);
        out.emplace_back(UnchangedLine{prefix + s.x + 1, prefix + s.y + 1, a[s.x]});
        break;
      case Op::del:
        dels.push_back(s.x);
        ++outcome.edit_distance;
        break;
      case Op::ins:
        ins.push_back(s.y);
        ++outcome.edit_distance;
        break;
    }
  }
  flush_hunk(a, b, prefix, dels, ins, out);

  for (std::size_t i = suffix; i > 0; --i) {
    const std::size_t oi = n - i;
    const std::size_t ni = m - i;
    out.emplace_back(UnchangedLine{oi + 1, ni + 1, old_lines[oi]});
  }
  return outcome;
}

}  // namespace verso
