#pragma once

// verso/report.hpp - Comparison reporting: counts, size ceiling, rendering.
//
// compare_lines() is the entry point HistoryQuery uses. It checks the size
// ceiling first and only then runs the diff engine, so an oversized pair of
// documents costs one digest comparison instead of a full alignment.
//
// Everything here is stateless and safe to call concurrently.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "verso/diff.hpp"
#include "verso/types.hpp"

namespace verso {

// Aggregate an existing diff. Unchanged entries are kept in `diff` but are not
// counted.
ComparisonResult report(std::vector<DiffEntry> entries);

struct LineComparison {
  ComparisonResult result;
  // size_limit_exceeded when the result is coarse, none otherwise.
  ErrorCode status{ErrorCode::none};
  std::string reason;
};

// Diff two line sequences under `limits`. Over the ceiling the result is
// coarse: counts zero, diff empty, `changed` from a content digest test.
LineComparison compare_lines(const std::vector<std::string>& old_lines,
                             const std::vector<std::string>& new_lines,
                             const DiffLimits& limits);

// ---------------------------------------------------------------------------
// Side-by-side rendering model
// ---------------------------------------------------------------------------
// Row i shows the same vertical position on both sides. A side with nothing
// to show at that row holds std::nullopt (rendered as a blank placeholder).
struct SideCell {
  std::size_t line{0};
  std::string text;
  DiffKind kind{DiffKind::unchanged};
};

struct SideRow {
  std::optional<SideCell> old_side;
  std::optional<SideCell> new_side;
};

struct SideBySideView {
  std::vector<SideRow> rows;
};

SideBySideView side_by_side(const std::vector<DiffEntry>& entries);

// Plain-text rendering, one line per row:
//   "  text" unchanged, "- text" deleted, "+ text" added,
//   a modification renders as its "-" line followed by its "+" line.
std::string render_unified(const std::vector<DiffEntry>& entries);

}  // namespace verso
