#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace modelgate {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds; generation requests run long, so the tail
  // buckets stretch to a minute.
  static constexpr std::array<double, 10> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 15000.0, 60000.0};
  std::array<std::atomic<uint64_t>, 11> counts{}; // 10 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  // One finished chat completion. `outcome` is "completed", "failed" or
  // "aborted"; `model` is empty when the request never named a valid one.
  void RecordRequest(const std::string &model, const std::string &outcome,
                     int prompt_tokens, int completion_tokens);
  // Failure by error code ("upstream_timeout", ...).
  void RecordError(const std::string &kind);
  // Full request duration in milliseconds.
  void RecordLatency(double request_ms);
  void RecordStreamFrames(std::size_t frames);
  // Connection answered 503 because max_connections was reached.
  void RecordRejectedConnection();

  // Gauge helpers.
  void IncrementConnections();
  void DecrementConnections();

  uint64_t TotalRequests() const { return total_requests_.load(); }
  int ActiveConnections() const { return active_connections_.load(); }

  std::string RenderPrometheus() const;

private:
  struct ModelStats {
    uint64_t requests{0};
    uint64_t prompt_tokens{0};
    uint64_t completion_tokens{0};
  };

  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> total_prompt_tokens_{0};
  std::atomic<uint64_t> total_completion_tokens_{0};
  std::atomic<uint64_t> stream_frames_{0};
  std::atomic<uint64_t> rejected_connections_{0};

  LatencyHistogram request_latency_;

  std::atomic<int> active_connections_{0};

  mutable std::mutex labelled_mutex_;
  std::map<std::string, uint64_t> outcomes_;
  std::map<std::string, uint64_t> errors_;
  std::map<std::string, ModelStats> model_stats_;
};

MetricsRegistry &GlobalMetrics();

} // namespace modelgate
