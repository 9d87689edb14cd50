#pragma once

// verso/blob_store.hpp - Content-addressed blob objects for the file store.
//
// DESIGN INVARIANTS:
//   1. Blob key = hash_domain("blob:", original_bytes). Identical content is
//      stored exactly once, whatever document or version refers to it.
//   2. Writes are atomic: tmp file + rename on the same filesystem.
//   3. Reads verify integrity twice: the stored bytes against the .meta
//      stored_blob_hash, then the decoded bytes against the key itself.
//   4. Fail-closed: an integrity failure yields nullopt, never wrong bytes.
//
// LAYOUT:
//   <root>/objects/AB/CD/<64-hex-key>
//   <root>/objects/AB/CD/<64-hex-key>.meta
//
// The two-level shard keeps directory fan-out small at any realistic size.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace verso {

struct BlobInfo {
  std::string key;
  std::string encoding{"identity"};  // "identity" or "zstd"
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;      // plain BLAKE3 of the bytes on disk
  uint64_t created_at_unix_ts{0};
};

class BlobStore {
 public:
  explicit BlobStore(std::string root);

  // Store data. Returns the blob key, or "" on I/O failure. An existing object
  // under the same key that no longer verifies is rewritten.
  // compression: "off" or "zstd". "zstd" falls back to identity encoding
  // when the build has no zstd support.
  std::string put(const std::string& data, const std::string& compression = "off");

  // Returns nullopt when the object is missing or fails verification.
  std::optional<std::string> get(const std::string& key) const;

  std::optional<BlobInfo> info(const std::string& key) const;

  bool contains(const std::string& key) const;

  std::string object_path(const std::string& key) const;
  std::string meta_path(const std::string& key) const;

 private:
  std::string root_;
};

// Atomic write: temp file in the target directory, then rename into place.
bool atomic_write_file(const std::string& target, const std::string& data);

}  // namespace verso
