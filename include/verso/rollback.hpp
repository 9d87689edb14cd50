#pragma once

// verso/rollback.hpp - Restore a historical version as a new head.
//
// Rollback never rewrites history. It appends a new version whose content is
// the target's content, re-read from the store (caller-held copies are never
// trusted), guarded by an optimistic check that the head has not moved since
// it was read. A moved head restarts the read-check-append sequence, at most
// rollback_attempts times.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "verso/history.hpp"
#include "verso/store.hpp"
#include "verso/types.hpp"

namespace verso {

// Called after a successful rollback with (document_id, new_version_id).
// Runs on the caller's thread. Anything the sink throws is reported on stderr
// and does not undo or fail the rollback.
using ChangeSink = std::function<void(const std::string& document_id,
                                      const std::string& version_id)>;

// "Rolled back to version <id> created at <ISO-8601 UTC>"
std::string rollback_message(const FileVersion& target);

// 2026-01-31T09:15:02.123Z
std::string format_iso8601_utc(uint64_t unix_ms);

class RollbackCoordinator {
 public:
  explicit RollbackCoordinator(std::shared_ptr<IVersionStore> store, uint32_t max_attempts = 3,
                               ChangeSink sink = nullptr);

  VersionResult rollback(const std::string& document_id, const std::string& target_version_id,
                         const std::string& author);

  // Same, addressing the target by its 1-based version number.
  VersionResult rollback_to_number(const std::string& document_id, uint64_t version_number,
                                   const std::string& author);

  void set_sink(ChangeSink sink) { sink_ = std::move(sink); }

 private:
  VersionResult attempt_rollback(const std::string& document_id,
                                 const std::string& target_version_id, const std::string& author);
  void notify(const std::string& document_id, const std::string& version_id) const;

  std::shared_ptr<IVersionStore> store_;
  HistoryQuery history_;  // target and head reads
  uint32_t max_attempts_;
  ChangeSink sink_;
};

}  // namespace verso
