#include "verso/report.hpp"

#include <variant>

#include "verso/hash.hpp"

namespace verso {

namespace {

std::size_t total_bytes(const std::vector<std::string>& lines) {
  std::size_t n = 0;
  for (const auto& l : lines) n += l.size() + 1;
  return n;
}

// Digest of the joined lines, used to answer "changed?" without aligning.
std::string lines_digest(const std::vector<std::string>& lines) {
  return content_digest(join_lines(lines));
}

LineComparison coarse(const std::vector<std::string>& old_lines,
                      const std::vector<std::string>& new_lines,
                      std::string reason) {
  LineComparison lc;
  lc.status = ErrorCode::size_limit_exceeded;
  lc.reason = std::move(reason);
  lc.result.coarse = true;
  lc.result.old_line_count = old_lines.size();
  lc.result.new_line_count = new_lines.size();
  lc.result.changed = old_lines.size() != new_lines.size() ||
                      lines_digest(old_lines) != lines_digest(new_lines);
  return lc;
}

}  // namespace

ComparisonResult report(std::vector<DiffEntry> entries) {
  ComparisonResult r;
  for (const auto& e : entries) {
    switch (kind_of(e)) {
      case DiffKind::add:
        ++r.additions;
        ++r.new_line_count;
        break;
      case DiffKind::remove:
        ++r.deletions;
        ++r.old_line_count;
        break;
      case DiffKind::modify:
        ++r.modifications;
        ++r.old_line_count;
        ++r.new_line_count;
        break;
      case DiffKind::unchanged:
        ++r.old_line_count;
        ++r.new_line_count;
        break;
    }
  }
  r.changed = (r.additions + r.deletions + r.modifications) > 0;
  r.diff = std::move(entries);
  return r;
}

LineComparison compare_lines(const std::vector<std::string>& old_lines,
                             const std::vector<std::string>& new_lines,
                             const DiffLimits& limits) {
  if (limits.max_lines > 0 &&
      (old_lines.size() > limits.max_lines || new_lines.size() > limits.max_lines)) {
    return coarse(old_lines, new_lines,
                  "line count exceeds " + std::to_string(limits.max_lines));
  }
  if (limits.max_bytes > 0 &&
      (total_bytes(old_lines) > limits.max_bytes || total_bytes(new_lines) > limits.max_bytes)) {
    return coarse(old_lines, new_lines,
                  "content size exceeds " + std::to_string(limits.max_bytes) + " bytes");
  }

  const std::size_t bound =
      limits.max_edit_distance > 0 ? limits.max_edit_distance : kDefaultMaxEditDistance;
  DiffOutcome outcome = diff_bounded(old_lines, new_lines, bound);
  if (outcome.truncated) {
    return coarse(old_lines, new_lines, "edit distance exceeds " + std::to_string(bound));
  }

  LineComparison lc;
  lc.result = report(std::move(outcome.entries));
  return lc;
}

SideBySideView side_by_side(const std::vector<DiffEntry>& entries) {
  SideBySideView view;
  view.rows.reserve(entries.size());
  for (const auto& e : entries) {
    SideRow row;
    if (const auto* a = std::get_if<AddedLine>(&e)) {
      row.new_side = SideCell{a->new_line, a->content, DiffKind::add};
    } else if (const auto* d = std::get_if<DeletedLine>(&e)) {
      row.old_side = SideCell{d->old_line, d->content, DiffKind::remove};
    } else if (const auto* m = std::get_if<ModifiedLine>(&e)) {
      row.old_side = SideCell{m->old_line, m->old_content, DiffKind::modify};
      row.new_side = SideCell{m->new_line, m->content, DiffKind::modify};
    } else {
      const auto& u = std::get<UnchangedLine>(e);
      row.old_side = SideCell{u.old_line, u.content, DiffKind::unchanged};
      row.new_side = SideCell{u.new_line, u.content, DiffKind::unchanged};
    }
    view.rows.push_back(std::move(row));
  }
  return view;
}

std::string render_unified(const std::vector<DiffEntry>& entries) {
  std::string out;
  for (const auto& e : entries) {
    if (const auto* a = std::get_if<AddedLine>(&e)) {
      out += "+ " + a->content + "\n";
    } else if (const auto* d = std::get_if<DeletedLine>(&e)) {
      out += "- " + d->content + "\n";
    } else if (const auto* m = std::get_if<ModifiedLine>(&e)) {
      out += "- " + m->old_content + "\n";
      out += "+ " + m->content + "\n";
    } else {
      out += "  " + std::get<UnchangedLine>(e).content + "\n";
    }
  }
  return out;
}

}  // namespace verso
