#pragma once

// verso/observability.hpp - Engine counters, latency histograms, event stream.
//
// DESIGN:
//   EngineEvent is the observable unit. Every create_version, compare and
//   rollback emits exactly one, which is:
//     - always folded into the process-wide EngineStats,
//     - forwarded to the installed hook if there is one,
//     - otherwise appended as one JSON line to the file named by
//       VERSO_EVENT_LOG (nothing is written when the variable is unset).
//   Events carry ids, sizes and outcomes only. Document content never leaves
//   the engine through this path.
//
// EXTENSION_POINT: external_exporter
//   set_engine_event_hook() is the seam for shipping events elsewhere. The
//   hook runs on the caller's thread and must not block.

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace verso {

enum class EventKind { create, compare, rollback };

std::string to_string(EventKind kind);

struct EngineEvent {
  EventKind kind{EventKind::create};
  std::string document_id;
  std::string version_id;        // created version, or "a..b" for compare
  bool ok{false};
  std::string error_code;        // to_string(ErrorCode), "" on success
  uint64_t duration_ns{0};
  bool coarse{false};            // compare only
  uint64_t changed_lines{0};     // compare only: additions+deletions+modifications
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket 0 holds [0, 1us); bucket i > 0 holds [2^(i-1) us, 2^i us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - process-wide aggregate
// ---------------------------------------------------------------------------
// Thread-safe; every member is atomic. Exposed through `verso stats --engine`.
class EngineStats {
 public:
  void record(const EngineEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> versions_created{0};
  std::atomic<uint64_t> create_failures{0};
  std::atomic<uint64_t> compares{0};
  std::atomic<uint64_t> coarse_compares{0};
  std::atomic<uint64_t> compare_failures{0};
  std::atomic<uint64_t> rollbacks{0};
  std::atomic<uint64_t> rollback_failures{0};

  // Failure categories, counted across all event kinds.
  std::atomic<uint64_t> conflicts{0};
  std::atomic<uint64_t> not_found{0};
  std::atomic<uint64_t> invalid_input{0};
  std::atomic<uint64_t> storage_failures{0};
  std::atomic<uint64_t> integrity_failures{0};

  LatencyHistogram create_latency;
  LatencyHistogram compare_latency;
};

EngineStats& global_engine_stats();

using EngineEventHook = void (*)(const EngineEvent&);

// Install (or clear, with nullptr) the event hook.
void set_engine_event_hook(EngineEventHook hook);

void emit_engine_event(const EngineEvent& ev);

std::string event_to_json(const EngineEvent& ev);

}  // namespace verso
