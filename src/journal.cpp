#include "verso/journal.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "verso/hash.hpp"
#include "verso/jsonlite.hpp"
#include "verso/types.hpp"
#include "verso/version.hpp"

namespace fs = std::filesystem;

namespace verso {

std::string journal_record_to_json(const JournalRecord& r) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["v"] = Value{static_cast<std::uint64_t>(r.format)};
  o["seq"] = Value{static_cast<std::uint64_t>(r.seq)};
  o["prev"] = Value{r.prev};
  o["id"] = Value{r.id};
  o["timestamp"] = Value{static_cast<std::uint64_t>(r.timestamp_unix_ms)};
  o["author"] = Value{r.author};
  o["message"] = r.message ? Value{*r.message} : Value{nullptr};
  o["content_digest"] = Value{r.content_digest};
  o["size"] = Value{static_cast<std::uint64_t>(r.size_bytes)};
  o["blob"] = Value{r.blob};
  return jsonlite::to_json(o);
}

std::optional<JournalRecord> parse_journal_record(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(line, &err);
  if (err) return std::nullopt;

  for (const char* key : {"v", "seq", "prev", "id", "timestamp", "author", "content_digest",
                          "size", "blob"}) {
    if (!jsonlite::has_key(obj, key)) return std::nullopt;
  }

  JournalRecord r;
  r.format = jsonlite::get_u64(obj, "v");
  r.seq = jsonlite::get_u64(obj, "seq");
  r.prev = jsonlite::get_string(obj, "prev");
  r.id = jsonlite::get_string(obj, "id");
  r.timestamp_unix_ms = jsonlite::get_u64(obj, "timestamp");
  r.author = jsonlite::get_string(obj, "author");
  r.message = jsonlite::get_optional_string(obj, "message");
  r.content_digest = jsonlite::get_string(obj, "content_digest");
  r.size_bytes = jsonlite::get_u64(obj, "size");
  r.blob = jsonlite::get_string(obj, "blob");
  return r;
}

JournalReplay replay_journal(const std::string& path) {
  JournalReplay out;
  out.tail = kJournalGenesis;

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    out.ok = !ec;
    if (ec) out.error = "cannot stat journal: " + ec.message();
    return out;
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    out.error = "cannot open journal " + path;
    return out;
  }

  std::string line;
  uint64_t expected_seq = 1;
  uint64_t last_ts = 0;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    const std::string where = "journal line " + std::to_string(expected_seq);

    auto rec = parse_journal_record(line);
    if (!rec) {
      out.error = where + ": malformed record";
      return out;
    }
    if (!version::journal_format_supported(rec->format)) {
      out.error = where + ": unsupported journal format " + std::to_string(rec->format);
      return out;
    }
    if (rec->seq != expected_seq || rec->id != format_version_id(expected_seq)) {
      out.error = where + ": sequence gap";
      return out;
    }
    if (rec->prev != out.tail) {
      out.error = where + ": chain digest mismatch";
      return out;
    }
    if (expected_seq > 1 && rec->timestamp_unix_ms <= last_ts) {
      out.error = where + ": timestamp not increasing";
      return out;
    }
    // Re-serialising must reproduce the exact bytes that were chained.
    if (journal_record_to_json(*rec) != line) {
      out.error = where + ": non-canonical record";
      return out;
    }

    out.tail = journal_chain_digest(out.tail, line);
    last_ts = rec->timestamp_unix_ms;
    ++expected_seq;
    out.records.push_back(std::move(*rec));
  }
  if (ifs.bad()) {
    out.error = "read error on journal " + path;
    return out;
  }
  out.ok = true;
  return out;
}

bool append_journal_line(const std::string& path, const std::string& line) {
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) return false;

  FILE* f = std::fopen(path.c_str(), "ab");
  if (!f) return false;

  std::fseek(f, 0, SEEK_END);
  const long pre_write_pos = std::ftell(f);
  if (pre_write_pos < 0) {
    std::fclose(f);
    return false;
  }

  const std::string final_line = line + "\n";
  bool ok = std::fwrite(final_line.data(), 1, final_line.size(), f) == final_line.size();
  ok = (std::fflush(f) == 0) && ok;
  if (ok) {
    const long post_write_pos = std::ftell(f);
    ok = post_write_pos >= pre_write_pos + static_cast<long>(final_line.size());
  }
  ok = (std::fclose(f) == 0) && ok;

  if (!ok) {
    fs::resize_file(path, static_cast<std::uintmax_t>(pre_write_pos), ec);
  }
  return ok;
}

}  // namespace verso
