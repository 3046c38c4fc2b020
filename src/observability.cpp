#include "warden/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "warden/jsonlite.hpp"

namespace warden {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return b >= LatencyHistogram::kBuckets ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fmt(const char* spec, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), spec, v);
  return buf;
}

std::atomic<OperationEventHook> g_event_hook{nullptr};

}  // namespace

std::string operation_event_to_json(const OperationEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"session_id\":\"" + jsonlite::escape(ev.session_id) + "\"";
  line += ",\"operation_id\":\"" + jsonlite::escape(ev.operation_id) + "\"";
  line += ",\"batch_id\":\"" + jsonlite::escape(ev.batch_id) + "\"";
  line += ",\"tool\":\"" + jsonlite::escape(ev.tool_name) + "\"";
  line += ",\"final_state\":\"" + ev.final_state + "\"";
  line += ",\"attempts\":" + std::to_string(ev.attempts);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"" + ev.error_code + "\"";
  line += ",\"duration_ns\":" + std::to_string(ev.duration_ns);
  line += ",\"rollback_partial\":";
  line += ev.rollback_partial ? "true" : "false";
  line += ",\"warnings\":" + std::to_string(ev.warnings) + "}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = i == 0 ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_us\":" + fmt("%.2f", mean_us());
  out += ",\"p50_us\":" + fmt("%.2f", percentile(0.50));
  out += ",\"p95_us\":" + fmt("%.2f", percentile(0.95));
  out += ",\"p99_us\":" + fmt("%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_operation(const OperationEvent& ev) {
  total_operations.fetch_add(1, std::memory_order_relaxed);
  total_attempts.fetch_add(ev.attempts, std::memory_order_relaxed);
  if (ev.final_state == "succeeded") {
    succeeded.fetch_add(1, std::memory_order_relaxed);
    if (ev.attempts > 1) recovered_by_retry.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.final_state == "rolled_back") {
    rolled_back.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.final_state == "skipped") {
    skipped.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.rollback_partial) partial_rollbacks.fetch_add(1, std::memory_order_relaxed);
  latency_histogram.record(ev.duration_ns);

  if (!ev.ok && !ev.error_code.empty()) {
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failure_categories_[ev.error_code];
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::map<std::string, std::uint64_t> EngineStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::vector<OperationEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<OperationEvent> out;
  out.reserve(ring_buffer_.size());
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void EngineStats::reset() {
  for (auto* c : {&total_operations, &succeeded, &failed, &rolled_back, &skipped, &total_attempts,
                  &recovered_by_retry, &partial_rollbacks}) {
    c->store(0, std::memory_order_relaxed);
  }
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    failure_categories_.clear();
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  const std::uint64_t total = total_operations.load(std::memory_order_relaxed);
  const std::uint64_t ok = succeeded.load(std::memory_order_relaxed);
  const double success_rate = total > 0 ? static_cast<double>(ok) / static_cast<double>(total) : 0.0;

  out += "{\"total_operations\":" + std::to_string(total);
  out += ",\"succeeded\":" + std::to_string(ok);
  out += ",\"failed\":" + std::to_string(failed.load(std::memory_order_relaxed));
  out += ",\"rolled_back\":" + std::to_string(rolled_back.load(std::memory_order_relaxed));
  out += ",\"skipped\":" + std::to_string(skipped.load(std::memory_order_relaxed));
  out += ",\"success_rate\":" + fmt("%.6f", success_rate);
  out += ",\"retries\":{\"total_attempts\":" + std::to_string(total_attempts.load(std::memory_order_relaxed));
  out += ",\"recovered\":" + std::to_string(recovered_by_retry.load(std::memory_order_relaxed)) + "}";
  out += ",\"partial_rollbacks\":" + std::to_string(partial_rollbacks.load(std::memory_order_relaxed));
  out += ",\"latency\":" + latency_histogram.to_json();
  out += ",\"failure_categories\":{";
  bool first = true;
  for (const auto& [code, count] : failure_categories()) {
    if (!first) out += ',';
    first = false;
    out += "\"" + code + "\":" + std::to_string(count);
  }
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

void set_operation_event_hook(OperationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_operation_event(const OperationEvent& ev, const std::string& log_path) {
  global_engine_stats().record_operation(ev);

  if (OperationEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  std::string path = log_path;
  if (path.empty()) {
    const char* env = std::getenv("WARDEN_EVENT_LOG");
    if (env && env[0]) path = env;
  }
  if (path.empty()) return;

  const std::string line = operation_event_to_json(ev) + "\n";
  // O_APPEND keeps concurrent writers from interleaving short lines.
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace warden
