#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace modelgate {

namespace {
MetricsRegistry g_metrics;

// Prometheus label value escaping.
std::string EscapeLabel(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}
}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRequest(const std::string& model,
                                    const std::string& outcome,
                                    int prompt_tokens, int completion_tokens) {
  uint64_t prompt = static_cast<uint64_t>(std::max(0, prompt_tokens));
  uint64_t completion = static_cast<uint64_t>(std::max(0, completion_tokens));
  total_requests_.fetch_add(1, std::memory_order_relaxed);
  total_prompt_tokens_.fetch_add(prompt, std::memory_order_relaxed);
  total_completion_tokens_.fetch_add(completion, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++outcomes_[outcome];
  if (!model.empty()) {
    auto& stats = model_stats_[model];
    ++stats.requests;
    stats.prompt_tokens += prompt;
    stats.completion_tokens += completion;
  }
}

void MetricsRegistry::RecordError(const std::string& kind) {
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++errors_[kind];
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::RecordStreamFrames(std::size_t frames) {
  stream_frames_.fetch_add(frames, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRejectedConnection() {
  rejected_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  // --- Counters ---
  out << "# HELP modelgate_requests_total Chat completion requests by outcome\n";
  out << "# TYPE modelgate_requests_total counter\n";
  {
    std::lock_guard<std::mutex> lock(labelled_mutex_);
    for (const auto& [outcome, count] : outcomes_) {
      out << "modelgate_requests_total{outcome=\"" << EscapeLabel(outcome)
          << "\"} " << count << "\n";
    }

    out << "# HELP modelgate_errors_total Failed requests by error code\n";
    out << "# TYPE modelgate_errors_total counter\n";
    for (const auto& [kind, count] : errors_) {
      out << "modelgate_errors_total{code=\"" << EscapeLabel(kind) << "\"} "
          << count << "\n";
    }

    out << "# HELP modelgate_model_requests_total Requests per routed model\n";
    out << "# TYPE modelgate_model_requests_total counter\n";
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_requests_total{model=\"" << EscapeLabel(model)
          << "\"} " << stats.requests << "\n";
    }

    out << "# HELP modelgate_model_prompt_tokens_total Prompt tokens per model\n";
    out << "# TYPE modelgate_model_prompt_tokens_total counter\n";
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_prompt_tokens_total{model=\""
          << EscapeLabel(model) << "\"} " << stats.prompt_tokens << "\n";
    }

    out << "# HELP modelgate_model_completion_tokens_total Completion tokens per model\n";
    out << "# TYPE modelgate_model_completion_tokens_total counter\n";
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_completion_tokens_total{model=\""
          << EscapeLabel(model) << "\"} " << stats.completion_tokens << "\n";
    }
  }

  out << "# HELP modelgate_prompt_tokens_total Total prompt tokens reported by backends\n";
  out << "# TYPE modelgate_prompt_tokens_total counter\n";
  out << "modelgate_prompt_tokens_total " << total_prompt_tokens_.load() << "\n";

  out << "# HELP modelgate_completion_tokens_total Total completion tokens reported by backends\n";
  out << "# TYPE modelgate_completion_tokens_total counter\n";
  out << "modelgate_completion_tokens_total " << total_completion_tokens_.load()
      << "\n";

  out << "# HELP modelgate_stream_frames_total SSE data frames relayed to clients\n";
  out << "# TYPE modelgate_stream_frames_total counter\n";
  out << "modelgate_stream_frames_total " << stream_frames_.load() << "\n";

  // --- Request latency histogram ---
  out << "# HELP modelgate_request_duration_ms Request end-to-end latency in milliseconds\n";
  out << "# TYPE modelgate_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "modelgate_request_duration_ms_bucket{le=\"" << std::fixed
        << std::setprecision(0) << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "modelgate_request_duration_ms_bucket{le=\"+Inf\"} "
      << request_latency_.counts[LatencyHistogram::kBuckets.size()].load()
      << "\n";
  out << "modelgate_request_duration_ms_sum " << request_latency_.sum_ms.load()
      << "\n";
  out << "modelgate_request_duration_ms_count " << request_latency_.total.load()
      << "\n";

  // --- Gauges ---
  out << "# HELP modelgate_active_connections Client connections being served\n";
  out << "# TYPE modelgate_active_connections gauge\n";
  out << "modelgate_active_connections " << active_connections_.load() << "\n";

  out << "# HELP modelgate_connections_rejected_total Connections refused at capacity\n";
  out << "# TYPE modelgate_connections_rejected_total counter\n";
  out << "modelgate_connections_rejected_total " << rejected_connections_.load()
      << "\n";

  return out.str();
}

MetricsRegistry& GlobalMetrics() { return g_metrics; }

}  // namespace modelgate
