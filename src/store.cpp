#include "verso/store.hpp"

#include <algorithm>
#include <chrono>

#include "verso/hash.hpp"
#include "verso/observability.hpp"

namespace verso {

namespace {

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

template <typename R>
R fail(ErrorCode code, std::string message) {
  R r;
  r.ok = false;
  r.error = code;
  r.message = std::move(message);
  return r;
}

void emit_create(const std::string& document_id, const VersionResult& r,
                 std::chrono::steady_clock::time_point started) {
  EngineEvent ev;
  ev.kind = EventKind::create;
  ev.document_id = document_id;
  ev.version_id = r.ok ? r.version.id : "";
  ev.ok = r.ok;
  ev.error_code = to_string(r.error);
  ev.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                             std::chrono::steady_clock::now() - started)
                                             .count());
  emit_engine_event(ev);
}

}  // namespace

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

bool valid_document_id(const std::string& document_id) {
  if (document_id.empty() || document_id.size() > 128) return false;
  if (document_id == "." || document_id == "..") return false;
  for (char c : document_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

bool valid_text(const std::string& text) {
  const auto* p = reinterpret_cast<const unsigned char*>(text.data());
  const size_t n = text.size();
  size_t i = 0;
  while (i < n) {
    const unsigned char c = p[i];
    if (c == 0) return false;
    if (c < 0x80) {
      ++i;
      continue;
    }
    size_t len = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n) return false;
    for (size_t k = 1; k < len; ++k) {
      if ((p[i + k] & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (p[i + k] & 0x3F);
    }
    // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    if (cp > 0x10FFFF) return false;
    i += len;
  }
  return true;
}

// ---------------------------------------------------------------------------
// LockedVersionStore
// ---------------------------------------------------------------------------

LockedVersionStore::LockedVersionStore(StoreOptions options) : options_(std::move(options)) {
  if (options_.lock_attempts == 0) options_.lock_attempts = 1;
  if (options_.default_page_limit == 0) options_.default_page_limit = 1;
  if (options_.max_page_limit < options_.default_page_limit) {
    options_.max_page_limit = options_.default_page_limit;
  }
}

LockedVersionStore::DocumentHistory* LockedVersionStore::acquire(const std::string& document_id,
                                                                 bool create) {
  {
    std::shared_lock<std::shared_mutex> lk(docs_mu_);
    auto it = docs_.find(document_id);
    if (it != docs_.end()) return it->second.get();
  }
  if (!create && !backend_has_document(document_id)) return nullptr;

  std::unique_lock<std::shared_mutex> lk(docs_mu_);
  auto& slot = docs_[document_id];
  if (!slot) slot = std::make_unique<DocumentHistory>();
  return slot.get();
}

void LockedVersionStore::ensure_loaded(const std::string& document_id, DocumentHistory& history) {
  std::call_once(history.load_once, [&] { load_history(document_id, history); });
}

VersionResult LockedVersionStore::create_version(const std::string& document_id,
                                                 const std::string& content,
                                                 const std::string& author,
                                                 const std::optional<std::string>& message,
                                                 const std::optional<std::string>& expected_head) {
  const auto started = std::chrono::steady_clock::now();
  auto finish = [&](VersionResult r) {
    emit_create(document_id, r, started);
    return r;
  };

  if (!valid_document_id(document_id)) {
    return finish(fail<VersionResult>(ErrorCode::invalid_input, "malformed document id"));
  }
  if (author.empty() || !valid_text(author)) {
    return finish(fail<VersionResult>(ErrorCode::invalid_input, "author must be non-empty UTF-8"));
  }
  if (!valid_text(content)) {
    return finish(fail<VersionResult>(ErrorCode::invalid_input,
                                      "content contains NUL bytes or invalid UTF-8"));
  }
  if (message && !valid_text(*message)) {
    return finish(fail<VersionResult>(ErrorCode::invalid_input,
                                      "message contains NUL bytes or invalid UTF-8"));
  }

  DocumentHistory* h = acquire(document_id, true);
  ensure_loaded(document_id, *h);
  if (h->load_error != ErrorCode::none) {
    return finish(fail<VersionResult>(h->load_error, h->load_message));
  }

  std::unique_lock<std::timed_mutex> wl(h->write_mu, std::defer_lock);
  for (uint32_t attempt = 0; attempt < options_.lock_attempts && !wl.owns_lock(); ++attempt) {
    (void)wl.try_lock_for(std::chrono::milliseconds(options_.lock_timeout_ms));
  }
  if (!wl.owns_lock()) {
    return finish(fail<VersionResult>(ErrorCode::concurrency_conflict,
                                      "document " + document_id + " is busy"));
  }

  // Only this thread mutates `versions` while write_mu is held, so reading it
  // here needs no shared lock.
  const std::string current_head = h->versions.empty() ? "" : h->versions.back().id;
  if (expected_head && *expected_head != current_head) {
    return finish(fail<VersionResult>(
        ErrorCode::concurrency_conflict,
        "head moved: expected '" + *expected_head + "', found '" + current_head + "'"));
  }

  FileVersion v;
  v.version_number = h->versions.size() + 1;
  v.id = format_version_id(v.version_number);
  v.document_id = document_id;
  v.content = content;
  v.author = author;
  v.message = message;
  v.content_digest = content_digest(content);
  v.size_bytes = content.size();
  const uint64_t now = now_unix_ms();
  v.timestamp_unix_ms = h->versions.empty() ? now
                                            : std::max(now, h->versions.back().timestamp_unix_ms + 1);

  std::string persist_error;
  if (!persist_version(document_id, *h, v, &persist_error)) {
    return finish(fail<VersionResult>(ErrorCode::storage_failed, persist_error));
  }

  {
    std::unique_lock<std::shared_mutex> rl(h->read_mu);
    h->versions.push_back(v);
  }

  VersionResult r;
  r.ok = true;
  r.version = std::move(v);
  return finish(std::move(r));
}

PageResult LockedVersionStore::list_versions(const std::string& document_id,
                                             const std::string& cursor, uint32_t limit) {
  if (!valid_document_id(document_id)) {
    return fail<PageResult>(ErrorCode::invalid_input, "malformed document id");
  }
  DocumentHistory* h = acquire(document_id, false);
  if (!h) return fail<PageResult>(ErrorCode::not_found, "unknown document " + document_id);
  ensure_loaded(document_id, *h);
  if (h->load_error != ErrorCode::none) return fail<PageResult>(h->load_error, h->load_message);

  if (limit == 0) limit = options_.default_page_limit;
  limit = std::min(limit, options_.max_page_limit);

  std::shared_lock<std::shared_mutex> rl(h->read_mu);
  const auto& versions = h->versions;
  if (versions.empty()) return fail<PageResult>(ErrorCode::not_found, "unknown document " + document_id);

  // `end` is one past the newest version still to be returned.
  size_t end = versions.size();
  if (!cursor.empty()) {
    const uint64_t n = parse_version_id(cursor);
    if (n == 0 || n > versions.size() || versions[n - 1].id != cursor) {
      return fail<PageResult>(ErrorCode::invalid_input, "unknown cursor " + cursor);
    }
    end = static_cast<size_t>(n - 1);
  }

  PageResult r;
  r.ok = true;
  while (end > 0 && r.page.versions.size() < limit) {
    r.page.versions.push_back(versions[--end]);
  }
  if (end > 0 && !r.page.versions.empty()) r.page.next_cursor = r.page.versions.back().id;
  return r;
}

VersionResult LockedVersionStore::get_version(const std::string& document_id,
                                              const std::string& version_id) {
  if (!valid_document_id(document_id)) {
    return fail<VersionResult>(ErrorCode::invalid_input, "malformed document id");
  }
  DocumentHistory* h = acquire(document_id, false);
  if (!h) return fail<VersionResult>(ErrorCode::not_found, "unknown document " + document_id);
  ensure_loaded(document_id, *h);
  if (h->load_error != ErrorCode::none) return fail<VersionResult>(h->load_error, h->load_message);

  std::shared_lock<std::shared_mutex> rl(h->read_mu);
  const uint64_t n = parse_version_id(version_id);
  if (n == 0 || n > h->versions.size() || h->versions[n - 1].id != version_id) {
    return fail<VersionResult>(ErrorCode::not_found,
                               "version " + version_id + " not in document " + document_id);
  }
  VersionResult r;
  r.ok = true;
  r.version = h->versions[n - 1];
  return r;
}

VersionResult LockedVersionStore::head(const std::string& document_id) {
  if (!valid_document_id(document_id)) {
    return fail<VersionResult>(ErrorCode::invalid_input, "malformed document id");
  }
  DocumentHistory* h = acquire(document_id, false);
  if (!h) return fail<VersionResult>(ErrorCode::not_found, "unknown document " + document_id);
  ensure_loaded(document_id, *h);
  if (h->load_error != ErrorCode::none) return fail<VersionResult>(h->load_error, h->load_message);

  std::shared_lock<std::shared_mutex> rl(h->read_mu);
  if (h->versions.empty()) {
    return fail<VersionResult>(ErrorCode::not_found, "unknown document " + document_id);
  }
  VersionResult r;
  r.ok = true;
  r.version = h->versions.back();
  return r;
}

std::vector<std::string> LockedVersionStore::list_documents() {
  std::vector<std::string> out = backend_documents();
  {
    std::shared_lock<std::shared_mutex> lk(docs_mu_);
    for (const auto& [id, h] : docs_) {
      std::shared_lock<std::shared_mutex> rl(h->read_mu);
      if (!h->versions.empty()) out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

// ---------------------------------------------------------------------------
// MemoryVersionStore
// ---------------------------------------------------------------------------

MemoryVersionStore::MemoryVersionStore(StoreOptions options)
    : LockedVersionStore(std::move(options)) {}

void MemoryVersionStore::load_history(const std::string&, DocumentHistory&) {}

bool MemoryVersionStore::persist_version(const std::string&, DocumentHistory&, const FileVersion&,
                                         std::string*) {
  return true;
}

bool MemoryVersionStore::backend_has_document(const std::string&) const { return false; }

}  // namespace verso
