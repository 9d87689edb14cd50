#pragma once

// verso/journal.hpp - Per-document append-only version journal.
//
// One NDJSON line per version, written after the version's content blob is
// durable. Each line carries a sequence number and the chain digest of the
// line before it:
//
//   {"author":..,"blob":..,"content_digest":..,"id":"v0000000002",
//    "message":null,"prev":<64-hex>,"seq":2,"size":..,"timestamp":..,"v":1}
//
//   prev(1)   = 64 zeros
//   prev(n+1) = journal_chain_digest(prev(n), line(n))
//
// Keys are emitted in sorted order (jsonlite objects are ordered maps), so a
// line's bytes are a pure function of its record.
//
// DESIGN INVARIANTS:
//   1. Lines are only ever appended. A failed append truncates the file back
//      to its previous length, so no partial record survives.
//   2. Replay fails closed: any sequence gap, chain break, unknown format
//      version or unparsable line marks the whole document as corrupt.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace verso {

inline constexpr const char* kJournalGenesis =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct JournalRecord {
  uint64_t format{1};
  uint64_t seq{0};                  // == version_number
  std::string prev;
  std::string id;
  uint64_t timestamp_unix_ms{0};
  std::string author;
  std::optional<std::string> message;
  std::string content_digest;
  uint64_t size_bytes{0};
  std::string blob;                 // BlobStore key of the content
};

std::string journal_record_to_json(const JournalRecord& r);

// Parse one journal line. Returns nullopt for malformed lines or records
// missing a required field.
std::optional<JournalRecord> parse_journal_record(const std::string& line);

struct JournalReplay {
  bool ok{false};
  std::string error;                // first problem found, when !ok
  std::vector<JournalRecord> records;
  std::string tail;                 // chain digest to use as the next prev
};

// Read and verify a whole journal file. A missing file replays as empty.
JournalReplay replay_journal(const std::string& path);

// Append one line (newline added here). On failure the file is restored to
// its previous length and false is returned.
bool append_journal_line(const std::string& path, const std::string& line);

}  // namespace verso
