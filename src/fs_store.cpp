#include "verso/store.hpp"

#include <filesystem>

#include "verso/hash.hpp"
#include "verso/journal.hpp"
#include "verso/version.hpp"

namespace fs = std::filesystem;

namespace verso {

namespace {
constexpr const char* kJournalSuffix = ".ndjson";
}

FsVersionStore::FsVersionStore(StoreOptions options)
    : LockedVersionStore(std::move(options)), blobs_(this->options().root) {
  // Failure here is not fatal: every write re-creates its parent directory
  // and reports storage_failed if that still does not work.
  std::error_code ec;
  fs::create_directories(fs::path(this->options().root) / "objects", ec);
  fs::create_directories(fs::path(this->options().root) / "docs", ec);
}

std::string FsVersionStore::journal_path(const std::string& document_id) const {
  return (fs::path(options().root) / "docs" / (document_id + kJournalSuffix)).string();
}

bool FsVersionStore::backend_has_document(const std::string& document_id) const {
  if (!valid_document_id(document_id)) return false;
  std::error_code ec;
  return fs::exists(journal_path(document_id), ec);
}

std::vector<std::string> FsVersionStore::backend_documents() const {
  std::vector<std::string> out;
  std::error_code ec;
  const fs::path dir = fs::path(options().root) / "docs";
  fs::directory_iterator it(dir, ec), end;
  if (ec) return out;
  const std::string suffix = kJournalSuffix;
  for (; it != end; it.increment(ec)) {
    if (ec) break;
    if (!it->is_regular_file(ec) || it->file_size(ec) == 0) continue;
    const std::string name = it->path().filename().string();
    if (name.size() <= suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }
    const std::string id = name.substr(0, name.size() - suffix.size());
    if (valid_document_id(id)) out.push_back(id);
  }
  return out;
}

void FsVersionStore::load_history(const std::string& document_id, DocumentHistory& history) {
  history.journal_tail = kJournalGenesis;

  JournalReplay replay = replay_journal(journal_path(document_id));
  if (!replay.ok) {
    history.load_error = ErrorCode::integrity_failed;
    history.load_message = "document " + document_id + ": " + replay.error;
    return;
  }

  std::vector<FileVersion> versions;
  versions.reserve(replay.records.size());
  for (auto& rec : replay.records) {
    auto content = blobs_.get(rec.blob);
    if (!content) {
      history.load_error = ErrorCode::integrity_failed;
      history.load_message = "document " + document_id + ": blob for " + rec.id +
                             " missing or corrupt";
      return;
    }
    if (content_digest(*content) != rec.content_digest || content->size() != rec.size_bytes) {
      history.load_error = ErrorCode::integrity_failed;
      history.load_message = "document " + document_id + ": content of " + rec.id +
                             " does not match its digest";
      return;
    }

    FileVersion v;
    v.id = std::move(rec.id);
    v.document_id = document_id;
    v.content = std::move(*content);
    v.timestamp_unix_ms = rec.timestamp_unix_ms;
    v.author = std::move(rec.author);
    v.message = std::move(rec.message);
    v.version_number = rec.seq;
    v.content_digest = std::move(rec.content_digest);
    v.size_bytes = rec.size_bytes;
    versions.push_back(std::move(v));
  }

  history.versions = std::move(versions);
  history.journal_tail = std::move(replay.tail);
}

bool FsVersionStore::persist_version(const std::string& document_id, DocumentHistory& history,
                                     const FileVersion& version, std::string* message) {
  // Blob first: it is content-addressed, so a blob left behind by a failed
  // journal append is harmless and is reused by the next identical write.
  const std::string key = blobs_.put(version.content, options().compression);
  if (key.empty()) {
    *message = "failed to write content blob for " + document_id;
    return false;
  }

  JournalRecord rec;
  rec.format = version::JOURNAL_FORMAT_VERSION;
  rec.seq = version.version_number;
  rec.prev = history.journal_tail;
  rec.id = version.id;
  rec.timestamp_unix_ms = version.timestamp_unix_ms;
  rec.author = version.author;
  rec.message = version.message;
  rec.content_digest = version.content_digest;
  rec.size_bytes = version.size_bytes;
  rec.blob = key;

  const std::string line = journal_record_to_json(rec);
  if (!append_journal_line(journal_path(document_id), line)) {
    *message = "failed to append journal for " + document_id;
    return false;
  }
  history.journal_tail = journal_chain_digest(history.journal_tail, line);
  return true;
}

}  // namespace verso
