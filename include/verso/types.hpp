#pragma once

// verso/types.hpp - Core value types for the Verso document history engine.
//
// DESIGN INVARIANTS:
//   1. FileVersion is a value type. Once returned by a store it is never
//      mutated; every copy is an independent snapshot.
//   2. DiffEntry is a closed sum type. Each alternative carries exactly the
//      fields that are meaningful for that kind of change.
//   3. No public API throws. Failures travel in the result structs below
//      (ok + ErrorCode + message), the same way for every operation.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references escape.
//   - Result structs are returned by value. Caller owns them.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace verso {

enum class ErrorCode {
  none,
  not_found,
  invalid_input,
  concurrency_conflict,
  size_limit_exceeded,
  storage_failed,
  integrity_failed,
  config_invalid,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// FileVersion - one immutable snapshot in a document's history
// ---------------------------------------------------------------------------
struct FileVersion {
  std::string id;                       // "v" + 10-digit version number
  std::string document_id;
  std::string content;
  uint64_t timestamp_unix_ms{0};        // strictly increasing per document
  std::string author;                   // opaque identity reference
  std::optional<std::string> message;
  uint64_t version_number{0};           // 1-based sequence within the document
  std::string content_digest;           // BLAKE3 "doc:" digest of content
  uint64_t size_bytes{0};
};

// Render the canonical id for a 1-based version number.
std::string format_version_id(uint64_t version_number);

// Inverse of format_version_id(). Returns 0 for anything but "v" + 10 digits.
uint64_t parse_version_id(const std::string& id);

// ---------------------------------------------------------------------------
// DiffEntry - tagged variant over the four line-level change kinds
// ---------------------------------------------------------------------------
// Line numbers are 1-based positions in the respective input sequence.
struct AddedLine {
  std::size_t new_line{0};
  std::string content;
};

struct DeletedLine {
  std::size_t old_line{0};
  std::string content;
};

struct ModifiedLine {
  std::size_t old_line{0};
  std::size_t new_line{0};
  std::string old_content;
  std::string content;
};

struct UnchangedLine {
  std::size_t old_line{0};
  std::size_t new_line{0};
  std::string content;
};

using DiffEntry = std::variant<AddedLine, DeletedLine, ModifiedLine, UnchangedLine>;

enum class DiffKind { add, remove, modify, unchanged };

DiffKind kind_of(const DiffEntry& entry);

// Wire name: "add", "delete", "modify", "unchanged".
std::string to_string(DiffKind kind);

// Line number on the side the entry is rendered on: the old side for
// deletions, the new side for everything else.
std::size_t display_line(const DiffEntry& entry);

// New or unchanged content (the deleted text for deletions).
const std::string& entry_content(const DiffEntry& entry);

// ---------------------------------------------------------------------------
// ComparisonResult - aggregate of one diff
// ---------------------------------------------------------------------------
struct ComparisonResult {
  std::size_t additions{0};
  std::size_t deletions{0};
  std::size_t modifications{0};
  std::vector<DiffEntry> diff;
  bool changed{false};
  // Set when the size ceiling short-circuited the alignment. diff is empty and
  // the counts are zero; only `changed` is meaningful.
  bool coarse{false};
  std::size_t old_line_count{0};
  std::size_t new_line_count{0};
};

// ---------------------------------------------------------------------------
// Per-operation results
// ---------------------------------------------------------------------------
struct VersionResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  FileVersion version;
};

struct VersionPage {
  std::vector<FileVersion> versions;  // most recent first
  std::string next_cursor;            // empty when the history is exhausted
};

struct PageResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  VersionPage page;
};

struct CompareResult {
  bool ok{false};
  // size_limit_exceeded is reported here with ok=true: the comparison
  // degraded to a coarse result but did not fail.
  ErrorCode error{ErrorCode::none};
  std::string message;
  ComparisonResult comparison;
};

struct DocumentStats {
  std::string document_id;
  uint64_t total_versions{0};
  uint64_t total_changes{0};
  std::vector<std::string> contributors;  // first-appearance order
  double avg_version_size{0.0};
  uint64_t first_timestamp_unix_ms{0};
  uint64_t last_timestamp_unix_ms{0};
};

struct StatsResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  DocumentStats stats;
};

}  // namespace verso
