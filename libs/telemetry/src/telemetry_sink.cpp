#include "txledger/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace txledger {
namespace telemetry {

std::string_view to_string(Metric metric) noexcept {
  switch (metric) {
    case Metric::kCommandsRouted:
      return "commands_routed";
    case Metric::kCommandsApplied:
      return "commands_applied";
    case Metric::kCommandsRejected:
      return "commands_rejected";
    case Metric::kEventsApplied:
      return "events_applied";
    case Metric::kRowsMalformed:
      return "rows_malformed";
    case Metric::kRouteLatency:
      return "route_latency";
  }
  return "unknown";
}

// StreamingHistogram implementation

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);  // 1.5 * 2^(idx-1)
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

// TelemetrySink implementation

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  counters_[static_cast<std::size_t>(metric)] += delta;
}

void TelemetrySink::record_latency(Metric metric, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[static_cast<std::size_t>(metric)].record(latency.count());
}

std::int64_t TelemetrySink::counter(Metric metric) const {
  std::scoped_lock lock(mutex_);
  return counters_[static_cast<std::size_t>(metric)];
}

std::vector<TelemetrySink::Counter> TelemetrySink::counters() const {
  std::scoped_lock lock(mutex_);
  std::vector<Counter> out;
  for (std::size_t idx = 0; idx < kMetricCount; ++idx) {
    if (counters_[idx] != 0) {
      out.push_back(Counter{.metric = static_cast<Metric>(idx), .value = counters_[idx]});
    }
  }
  return out;
}

std::vector<TelemetrySink::LatencySummary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<LatencySummary> summaries;

  for (std::size_t idx = 0; idx < kMetricCount; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }

    summaries.push_back(LatencySummary{
        .metric = static_cast<Metric>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
        .max_ns = hist.max(),
    });

    hist.reset();
  }

  return summaries;
}

}  // namespace telemetry
}  // namespace txledger
