#include "verso/wire.hpp"

#include "verso/jsonlite.hpp"

namespace verso {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Value u64(uint64_t n) { return Value{static_cast<std::uint64_t>(n)}; }

Object version_object(const FileVersion& v, bool include_content) {
  Object o;
  o["id"] = Value{v.id};
  o["documentId"] = Value{v.document_id};
  if (include_content) o["content"] = Value{v.content};
  o["timestamp"] = u64(v.timestamp_unix_ms);
  o["author"] = Value{v.author};
  o["message"] = v.message ? Value{*v.message} : Value{nullptr};
  o["versionNumber"] = u64(v.version_number);
  o["contentDigest"] = Value{v.content_digest};
  o["size"] = u64(v.size_bytes);
  return o;
}

Object entry_object(const DiffEntry& e) {
  Object o;
  o["type"] = Value{to_string(kind_of(e))};
  o["lineNumber"] = u64(display_line(e));
  o["content"] = Value{entry_content(e)};
  if (const auto* m = std::get_if<ModifiedLine>(&e)) {
    o["oldContent"] = Value{m->old_content};
  } else {
    o["oldContent"] = Value{nullptr};
  }
  return o;
}

Value cell_value(const std::optional<SideCell>& cell) {
  if (!cell) return Value{nullptr};
  Object o;
  o["line"] = u64(cell->line);
  o["text"] = Value{cell->text};
  o["type"] = Value{to_string(cell->kind)};
  return Value{std::move(o)};
}

}  // namespace

std::string version_to_json(const FileVersion& v, bool include_content) {
  return jsonlite::to_json(version_object(v, include_content));
}

std::string diff_entry_to_json(const DiffEntry& e) { return jsonlite::to_json(entry_object(e)); }

std::string comparison_to_json(const ComparisonResult& c) {
  Array diff;
  diff.reserve(c.diff.size());
  for (const auto& e : c.diff) diff.push_back(Value{entry_object(e)});

  Object o;
  o["additions"] = u64(c.additions);
  o["deletions"] = u64(c.deletions);
  o["modifications"] = u64(c.modifications);
  o["changed"] = Value{c.changed};
  o["coarse"] = Value{c.coarse};
  o["diff"] = Value{std::move(diff)};
  return jsonlite::to_json(o);
}

std::string page_to_json(const VersionPage& page, bool include_content) {
  Array versions;
  versions.reserve(page.versions.size());
  for (const auto& v : page.versions) versions.push_back(Value{version_object(v, include_content)});

  Object o;
  o["versions"] = Value{std::move(versions)};
  o["nextCursor"] = page.next_cursor.empty() ? Value{nullptr} : Value{page.next_cursor};
  return jsonlite::to_json(o);
}

std::string stats_to_json(const DocumentStats& s) {
  Array contributors;
  for (const auto& c : s.contributors) contributors.push_back(Value{c});

  Object o;
  o["documentId"] = Value{s.document_id};
  o["totalVersions"] = u64(s.total_versions);
  o["totalChanges"] = u64(s.total_changes);
  o["contributors"] = Value{std::move(contributors)};
  o["avgVersionSize"] = Value{s.avg_version_size};
  o["firstTimestamp"] = u64(s.first_timestamp_unix_ms);
  o["lastTimestamp"] = u64(s.last_timestamp_unix_ms);
  return jsonlite::to_json(o);
}

std::string side_by_side_to_json(const SideBySideView& view) {
  Array rows;
  rows.reserve(view.rows.size());
  for (const auto& row : view.rows) {
    Object r;
    r["old"] = cell_value(row.old_side);
    r["new"] = cell_value(row.new_side);
    rows.push_back(Value{std::move(r)});
  }
  Object o;
  o["rows"] = Value{std::move(rows)};
  return jsonlite::to_json(o);
}

std::string error_to_json(ErrorCode code, const std::string& message) {
  Object o;
  o["error"] = Value{to_string(code)};
  o["message"] = Value{message};
  return jsonlite::to_json(o);
}

}  // namespace verso
