#include "verso/rollback.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>

#include "verso/jsonlite.hpp"
#include "verso/observability.hpp"

namespace verso {

std::string format_iso8601_utc(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000u);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03uZ", date, static_cast<unsigned>(unix_ms % 1000u));
  return out;
}

std::string rollback_message(const FileVersion& target) {
  return "Rolled back to version " + target.id + " created at " +
         format_iso8601_utc(target.timestamp_unix_ms);
}

namespace {

void report_sink_failure(const std::string& document_id, const std::string& error) {
  std::fprintf(stderr, "{\"event\":\"change_sink_failed\",\"document_id\":%s,\"error\":%s}\n",
               jsonlite::quote(document_id).c_str(), jsonlite::quote(error).c_str());
}

}  // namespace

RollbackCoordinator::RollbackCoordinator(std::shared_ptr<IVersionStore> store,
                                         uint32_t max_attempts, ChangeSink sink)
    : store_(std::move(store)), history_(store_), max_attempts_(max_attempts == 0 ? 1 : max_attempts),
      sink_(std::move(sink)) {}

VersionResult RollbackCoordinator::attempt_rollback(const std::string& document_id,
                                                    const std::string& target_version_id,
                                                    const std::string& author) {
  VersionResult last;
  for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt) {
    VersionResult target = history_.get_version(document_id, target_version_id);
    if (!target.ok) return target;

    VersionResult head = history_.current(document_id);
    if (!head.ok) return head;

    last = store_->create_version(document_id, target.version.content, author,
                                  rollback_message(target.version), head.version.id);
    if (last.ok || last.error != ErrorCode::concurrency_conflict) return last;
  }
  last.message = "head kept moving after " + std::to_string(max_attempts_) +
                 " rollback attempts: " + last.message;
  return last;
}

VersionResult RollbackCoordinator::rollback(const std::string& document_id,
                                            const std::string& target_version_id,
                                            const std::string& author) {
  const auto started = std::chrono::steady_clock::now();
  VersionResult r = attempt_rollback(document_id, target_version_id, author);

  EngineEvent ev;
  ev.kind = EventKind::rollback;
  ev.document_id = document_id;
  ev.version_id = r.ok ? r.version.id : target_version_id;
  ev.ok = r.ok;
  ev.error_code = to_string(r.error);
  ev.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                             std::chrono::steady_clock::now() - started)
                                             .count());
  emit_engine_event(ev);

  if (r.ok) notify(document_id, r.version.id);
  return r;
}

VersionResult RollbackCoordinator::rollback_to_number(const std::string& document_id,
                                                      uint64_t version_number,
                                                      const std::string& author) {
  if (version_number == 0) {
    VersionResult r;
    r.error = ErrorCode::invalid_input;
    r.message = "version numbers start at 1";
    return r;
  }
  return rollback(document_id, format_version_id(version_number), author);
}

void RollbackCoordinator::notify(const std::string& document_id,
                                 const std::string& version_id) const {
  if (!sink_) return;
  try {
    sink_(document_id, version_id);
  } catch (const std::exception& e) {
    report_sink_failure(document_id, e.what());
  } catch (...) {
    report_sink_failure(document_id, "non-standard exception");
  }
}

}  // namespace verso
