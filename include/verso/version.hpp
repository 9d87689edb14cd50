#pragma once

// verso/version.hpp - Version manifest for every persisted or exchanged format.
//
// PURPOSE:
//   Keep the on-disk store and the JSON surfaces from drifting silently. Any
//   code that reads a versioned format checks the matching constant here.
//
// INVARIANT:
//   All format constants are compile-time. A reader never accepts data whose
//   format version is newer than the one it was compiled against.

#include <cstdint>
#include <string>

namespace verso {
namespace version {

// ---------------------------------------------------------------------------
// JOURNAL_FORMAT_VERSION
// Per-document NDJSON journal under <root>/docs/. Every record carries it in
// its "v" field. Version 1: seq/prev chaining, metadata only, content in blobs.
// ---------------------------------------------------------------------------
constexpr uint32_t JOURNAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// BLOB_FORMAT_VERSION
// Layout of content objects: objects/AB/CD/<64-hex> plus a JSON .meta sidecar.
// ---------------------------------------------------------------------------
constexpr uint32_t BLOB_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with "doc:", "blob:" and "log:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// DIFF_ALGORITHM_VERSION
// Version 1 = Myers with prefix-then-suffix stripping, delete-first tie-break,
// canonical side ordering and min(d, a) modify collapsing. Any change to the
// produced entries for the same input requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t DIFF_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t journal_format{JOURNAL_FORMAT_VERSION};
  uint32_t blob_format{BLOB_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t diff_algorithm{DIFF_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string compression;      // "zstd" when built with zstd, else "identity"
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

// True when a journal record written with `found` can be read by this build.
bool journal_format_supported(uint64_t found);

}  // namespace version
}  // namespace verso
