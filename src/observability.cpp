#include "verso/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "verso/jsonlite.hpp"

namespace verso {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0, which is the bucket index.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_counter(std::string& out, const char* key, const std::atomic<uint64_t>& value,
                    bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += key;
  out += "\":";
  out += std::to_string(value.load(std::memory_order_relaxed));
}

}  // namespace

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::create:   return "create";
    case EventKind::compare:  return "compare";
    case EventKind::rollback: return "rollback";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const EngineEvent& ev) {
  switch (ev.kind) {
    case EventKind::create:
      (ev.ok ? versions_created : create_failures).fetch_add(1, std::memory_order_relaxed);
      create_latency.record(ev.duration_ns);
      break;
    case EventKind::compare:
      if (ev.ok) {
        compares.fetch_add(1, std::memory_order_relaxed);
        if (ev.coarse) coarse_compares.fetch_add(1, std::memory_order_relaxed);
        compare_latency.record(ev.duration_ns);
      } else {
        compare_failures.fetch_add(1, std::memory_order_relaxed);
      }
      break;
    case EventKind::rollback:
      (ev.ok ? rollbacks : rollback_failures).fetch_add(1, std::memory_order_relaxed);
      break;
  }

  if (ev.ok) return;
  if (ev.error_code == "concurrency_conflict") {
    conflicts.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == "not_found") {
    not_found.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == "invalid_input") {
    invalid_input.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == "storage_failed") {
    storage_failures.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == "integrity_failed") {
    integrity_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"versions\":{";
  append_counter(out, "created", versions_created, true);
  append_counter(out, "create_failures", create_failures);
  out += "},\"compare\":{";
  append_counter(out, "total", compares, true);
  append_counter(out, "coarse", coarse_compares);
  append_counter(out, "failures", compare_failures);
  out += "},\"rollback\":{";
  append_counter(out, "total", rollbacks, true);
  append_counter(out, "failures", rollback_failures);
  out += "},\"failure_categories\":{";
  append_counter(out, "concurrency_conflict", conflicts, true);
  append_counter(out, "not_found", not_found);
  append_counter(out, "invalid_input", invalid_input);
  append_counter(out, "storage_failed", storage_failures);
  append_counter(out, "integrity_failed", integrity_failures);
  out += "},\"latency\":{\"create\":";
  out += create_latency.to_json();
  out += ",\"compare\":";
  out += compare_latency.to_json();
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<EngineEventHook> g_event_hook{nullptr};
}

void set_engine_event_hook(EngineEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const EngineEvent& ev) {
  std::string line;
  line.reserve(192);
  line += "{\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"document_id\":";
  line += jsonlite::quote(ev.document_id);
  line += ",\"version_id\":";
  line += jsonlite::quote(ev.version_id);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  if (ev.kind == EventKind::compare) {
    line += ",\"coarse\":";
    line += ev.coarse ? "true" : "false";
    line += ",\"changed_lines\":";
    line += std::to_string(ev.changed_lines);
  }
  line += '}';
  return line;
}

void emit_engine_event(const EngineEvent& ev) {
  global_engine_stats().record(ev);

  EngineEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: VERSO_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("VERSO_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = event_to_json(ev) + "\n";
  // O_APPEND keeps short lines from concurrent writers intact on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace verso
