#pragma once

// warden/observability.hpp: Structured operation observability layer.
//
// DESIGN:
//   OperationEvent is the canonical observable unit. Every sealed operation
//   emits exactly one OperationEvent, which is:
//     - folded into the process-wide EngineStats (always),
//     - passed to a registered hook if one is set, otherwise
//     - appended as one JSON line to the event log when a path is configured.
//
// EXTENSION_POINT: event_export
//   Current: JSONL file sink or an in-process hook.
//   Upgrade path: a background drain that forwards the ring buffer to an
//   external collector.
//   Invariant: event emission must NEVER fail or abort an operation.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

// ---------------------------------------------------------------------------
// OperationEvent: per-operation observable unit
// ---------------------------------------------------------------------------
struct OperationEvent {
  std::string session_id;
  std::string operation_id;
  std::string batch_id;
  std::string tool_name;
  std::string final_state;
  std::uint32_t attempts{0};
  bool ok{false};
  std::string error_code;
  std::uint64_t duration_ns{0};
  bool rollback_partial{false};
  std::uint32_t warnings{0};
};

std::string operation_event_to_json(const OperationEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 if empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; failure categories and the recent-event
// ring are mutex-protected.
class EngineStats {
 public:
  void record_operation(const OperationEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<std::uint64_t> total_operations{0};
  alignas(64) std::atomic<std::uint64_t> succeeded{0};
  alignas(64) std::atomic<std::uint64_t> failed{0};
  alignas(64) std::atomic<std::uint64_t> rolled_back{0};
  alignas(64) std::atomic<std::uint64_t> skipped{0};
  alignas(64) std::atomic<std::uint64_t> total_attempts{0};
  alignas(64) std::atomic<std::uint64_t> recovered_by_retry{0};
  alignas(64) std::atomic<std::uint64_t> partial_rollbacks{0};

  LatencyHistogram latency_histogram;

  // error_code -> count, for non-succeeded operations.
  std::map<std::string, std::uint64_t> failure_categories() const;

  // MICRO_OPT: O(1) circular buffer; ring_head_ is the next slot to overwrite.
  static constexpr std::size_t kMaxRecentEvents = 256;
  std::vector<OperationEvent> recent_events_snapshot() const;

  void reset();

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, std::uint64_t> failure_categories_;

  mutable std::mutex ring_mu_;
  std::vector<OperationEvent> ring_buffer_;
  std::size_t ring_head_{0};
};

EngineStats& global_engine_stats();

// Record the event, then hand it to the hook or append it to the event log.
// log_path overrides WARDEN_EVENT_LOG; both empty means no file sink.
void emit_operation_event(const OperationEvent& ev, const std::string& log_path = "");

using OperationEventHook = void (*)(const OperationEvent&);
void set_operation_event_hook(OperationEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace warden
