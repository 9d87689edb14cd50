#include "verso/history.hpp"

#include <algorithm>
#include <chrono>
#include <set>

#include "verso/observability.hpp"
#include "verso/report.hpp"

namespace verso {

namespace {

std::vector<std::string> lines_of(const std::string& content) {
  return split_lines(normalize_line_endings(content));
}

CompareResult compare_failure(const std::string& document_id, const VersionResult& r) {
  EngineEvent ev;
  ev.kind = EventKind::compare;
  ev.document_id = document_id;
  ev.ok = false;
  ev.error_code = to_string(r.error);
  emit_engine_event(ev);

  CompareResult out;
  out.ok = false;
  out.error = r.error;
  out.message = r.message;
  return out;
}

}  // namespace

HistoryQuery::HistoryQuery(std::shared_ptr<IVersionStore> store, DiffLimits limits)
    : store_(std::move(store)), limits_(limits) {}

PageResult HistoryQuery::list_versions(const std::string& document_id, const std::string& cursor,
                                       uint32_t limit) const {
  return store_->list_versions(document_id, cursor, limit);
}

VersionResult HistoryQuery::get_version(const std::string& document_id,
                                        const std::string& version_id) const {
  return store_->get_version(document_id, version_id);
}

VersionResult HistoryQuery::current(const std::string& document_id) const {
  return store_->head(document_id);
}

VersionResult HistoryQuery::resolve(const std::string& document_id,
                                    const std::string& version_id) const {
  if (version_id == kCurrentVersion) return store_->head(document_id);
  return store_->get_version(document_id, version_id);
}

CompareResult HistoryQuery::compare_contents(const std::string& document_id,
                                             const std::string& label,
                                             const std::vector<std::string>& old_lines,
                                             const std::vector<std::string>& new_lines) const {
  const auto started = std::chrono::steady_clock::now();
  LineComparison lc = compare_lines(old_lines, new_lines, limits_);

  CompareResult out;
  out.ok = true;
  out.error = lc.status;
  out.message = std::move(lc.reason);
  out.comparison = std::move(lc.result);

  EngineEvent ev;
  ev.kind = EventKind::compare;
  ev.document_id = document_id;
  ev.version_id = label;
  ev.ok = true;
  ev.error_code = to_string(out.error);
  ev.coarse = out.comparison.coarse;
  ev.changed_lines = out.comparison.additions + out.comparison.deletions +
                     out.comparison.modifications;
  ev.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                             std::chrono::steady_clock::now() - started)
                                             .count());
  emit_engine_event(ev);
  return out;
}

CompareResult HistoryQuery::compare(const std::string& document_id, const std::string& version_a,
                                    const std::string& version_b) const {
  VersionResult a = resolve(document_id, version_a);
  if (!a.ok) return compare_failure(document_id, a);
  VersionResult b = resolve(document_id, version_b);
  if (!b.ok) return compare_failure(document_id, b);

  return compare_contents(document_id, a.version.id + ".." + b.version.id,
                          lines_of(a.version.content), lines_of(b.version.content));
}

CompareResult HistoryQuery::compare_with_draft(const std::string& document_id,
                                               const std::string& version_a,
                                               const std::vector<std::string>& draft_lines) const {
  VersionResult a = resolve(document_id, version_a);
  if (!a.ok) return compare_failure(document_id, a);
  return compare_contents(document_id, a.version.id + "..draft", lines_of(a.version.content),
                          draft_lines);
}

StatsResult HistoryQuery::statistics(const std::string& document_id) const {
  StatsResult out;

  // Walk the full history newest-first, one page at a time.
  std::vector<FileVersion> history;
  std::string cursor;
  do {
    PageResult page = store_->list_versions(document_id, cursor, 0);
    if (!page.ok) {
      out.error = page.error;
      out.message = page.message;
      return out;
    }
    for (auto& v : page.page.versions) history.push_back(std::move(v));
    cursor = page.page.next_cursor;
  } while (!cursor.empty());
  std::reverse(history.begin(), history.end());

  DocumentStats& s = out.stats;
  s.document_id = document_id;
  s.total_versions = history.size();
  s.first_timestamp_unix_ms = history.front().timestamp_unix_ms;
  s.last_timestamp_unix_ms = history.back().timestamp_unix_ms;

  std::set<std::string> seen;
  uint64_t total_size = 0;
  std::vector<std::string> previous;
  for (size_t i = 0; i < history.size(); ++i) {
    const FileVersion& v = history[i];
    if (seen.insert(v.author).second) s.contributors.push_back(v.author);
    total_size += v.size_bytes;

    std::vector<std::string> lines = lines_of(v.content);
    if (i > 0) {
      LineComparison lc = compare_lines(previous, lines, limits_);
      if (lc.result.coarse) {
        s.total_changes += lc.result.changed ? 1 : 0;
      } else {
        s.total_changes += lc.result.additions + lc.result.deletions + lc.result.modifications;
      }
    }
    previous = std::move(lines);
  }
  s.avg_version_size = static_cast<double>(total_size) / static_cast<double>(history.size());

  out.ok = true;
  return out;
}

}  // namespace verso
