#pragma once

// verso/store.hpp - Version store interface and its two backends.
//
// DESIGN INVARIANTS (every implementation):
//   1. Histories are append-only. A version, once returned by create_version,
//      is never modified, renumbered or removed.
//   2. Within one document, creation is totally ordered: version numbers are
//      dense from 1 and timestamps strictly increase (max(now, last + 1)).
//   3. Writers to one document are serialised by that document's timed mutex.
//      Lock acquisition is bounded (lock_attempts x lock_timeout_ms); running
//      out reports concurrency_conflict instead of blocking forever.
//   4. Readers never observe a half-created version. A version becomes
//      visible only after it is durable in the backend.
//   5. All input is validated before anything is written. A rejected create
//      leaves no trace.
//
// CONCURRENCY:
//   Different documents never share a lock. The store-wide map of documents
//   is guarded by a shared_mutex that is only taken exclusively to insert a
//   new document entry.
//
// EXTENSION_POINT: remote_backend
//   A database or object-storage backend implements IVersionStore directly,
//   or derives from LockedVersionStore and supplies load_history() and
//   persist_version() only.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "verso/blob_store.hpp"
#include "verso/config.hpp"
#include "verso/types.hpp"

namespace verso {

// ---------------------------------------------------------------------------
// Input validation shared by every backend
// ---------------------------------------------------------------------------

// [A-Za-z0-9._-], 1..128 chars, not "." or "..".
bool valid_document_id(const std::string& document_id);

// Well-formed UTF-8 with no NUL bytes.
bool valid_text(const std::string& text);

// ---------------------------------------------------------------------------
// IVersionStore
// ---------------------------------------------------------------------------
class IVersionStore {
 public:
  virtual ~IVersionStore() = default;

  // Append a new version. expected_head enables optimistic concurrency: when
  // set, the call fails with concurrency_conflict unless the document's
  // current head id equals it ("" means "the document has no versions").
  virtual VersionResult create_version(const std::string& document_id,
                                       const std::string& content,
                                       const std::string& author,
                                       const std::optional<std::string>& message,
                                       const std::optional<std::string>& expected_head = std::nullopt) = 0;

  // Most recent first. cursor is the id of the last version the caller has
  // seen ("" starts at the head). limit 0 means the configured default.
  virtual PageResult list_versions(const std::string& document_id,
                                   const std::string& cursor = "",
                                   uint32_t limit = 0) = 0;

  virtual VersionResult get_version(const std::string& document_id,
                                    const std::string& version_id) = 0;

  virtual VersionResult head(const std::string& document_id) = 0;

  // Every document with at least one version, sorted.
  virtual std::vector<std::string> list_documents() = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// LockedVersionStore - shared locking and bookkeeping for both backends
// ---------------------------------------------------------------------------
class LockedVersionStore : public IVersionStore {
 public:
  explicit LockedVersionStore(StoreOptions options);

  VersionResult create_version(const std::string& document_id,
                               const std::string& content,
                               const std::string& author,
                               const std::optional<std::string>& message,
                               const std::optional<std::string>& expected_head = std::nullopt) override;
  PageResult list_versions(const std::string& document_id, const std::string& cursor = "",
                           uint32_t limit = 0) override;
  VersionResult get_version(const std::string& document_id,
                            const std::string& version_id) override;
  VersionResult head(const std::string& document_id) override;
  std::vector<std::string> list_documents() override;

  const StoreOptions& options() const { return options_; }

 protected:
  struct DocumentHistory {
    std::timed_mutex write_mu;           // serialises create_version
    mutable std::shared_mutex read_mu;   // guards versions
    std::vector<FileVersion> versions;   // ascending, versions[i].version_number == i + 1
    std::string journal_tail;            // backend-specific chain state
    std::once_flag load_once;
    ErrorCode load_error{ErrorCode::none};
    std::string load_message;
  };

  // Populate a fresh history from the backend. Called once per document per
  // store instance, before any other access. Sets load_error on failure.
  virtual void load_history(const std::string& document_id, DocumentHistory& history) = 0;

  // Make `version` durable. Called with history.write_mu held. On failure
  // returns false with *message set; nothing may have become visible.
  virtual bool persist_version(const std::string& document_id, DocumentHistory& history,
                               const FileVersion& version, std::string* message) = 0;

  // Whether the backend knows the document even though this instance has not
  // loaded it yet.
  virtual bool backend_has_document(const std::string& document_id) const = 0;

  // Documents present in the backend that may not be loaded yet.
  virtual std::vector<std::string> backend_documents() const { return {}; }

 private:
  // nullptr when the document is unknown and create is false.
  DocumentHistory* acquire(const std::string& document_id, bool create);
  void ensure_loaded(const std::string& document_id, DocumentHistory& history);

  StoreOptions options_;
  mutable std::shared_mutex docs_mu_;
  std::map<std::string, std::unique_ptr<DocumentHistory>> docs_;
};

// ---------------------------------------------------------------------------
// MemoryVersionStore - in-process backend
// ---------------------------------------------------------------------------
class MemoryVersionStore : public LockedVersionStore {
 public:
  explicit MemoryVersionStore(StoreOptions options = {});

  std::string backend_id() const override { return "memory"; }

 protected:
  void load_history(const std::string& document_id, DocumentHistory& history) override;
  bool persist_version(const std::string& document_id, DocumentHistory& history,
                       const FileVersion& version, std::string* message) override;
  bool backend_has_document(const std::string& document_id) const override;
};

// ---------------------------------------------------------------------------
// FsVersionStore - file-backed backend
// ---------------------------------------------------------------------------
// Layout under options.root:
//   objects/AB/CD/<key>[.meta]   content blobs (see blob_store.hpp)
//   docs/<document_id>.ndjson    per-document journal (see journal.hpp)
//
// Journals are replayed lazily, the first time a document is touched. A
// document whose journal or blobs fail verification reports integrity_failed
// for every operation; other documents are unaffected.
//
// One FsVersionStore instance per root per process. Separate processes
// writing the same root are not coordinated.
class FsVersionStore : public LockedVersionStore {
 public:
  explicit FsVersionStore(StoreOptions options);

  std::string backend_id() const override { return "fs"; }

  std::string journal_path(const std::string& document_id) const;
  const BlobStore& blobs() const { return blobs_; }

 protected:
  void load_history(const std::string& document_id, DocumentHistory& history) override;
  bool persist_version(const std::string& document_id, DocumentHistory& history,
                       const FileVersion& version, std::string* message) override;
  bool backend_has_document(const std::string& document_id) const override;
  std::vector<std::string> backend_documents() const override;

 private:
  BlobStore blobs_;
};

}  // namespace verso
