#include "settlecore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace settlecore {
namespace telemetry {

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx < 2) {
    return static_cast<std::int64_t>(idx);
  }
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
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

std::uint64_t Summary::rejected() const noexcept {
  std::uint64_t total = 0;
  for (std::size_t idx = 0; idx < outcomes.size(); ++idx) {
    if (idx != static_cast<std::size_t>(ledger::Outcome::kApplied)) {
      total += outcomes[idx];
    }
  }
  return total;
}

void TelemetrySink::record_outcome(ledger::Outcome outcome) {
  std::scoped_lock lock(mutex_);
  ++outcomes_[static_cast<std::size_t>(outcome)];
}

void TelemetrySink::record_malformed_row() {
  std::scoped_lock lock(mutex_);
  ++malformed_rows_;
}

void TelemetrySink::record_latency(std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  latency_.record(latency.count());
}

Summary TelemetrySink::summary() const {
  std::scoped_lock lock(mutex_);
  return Summary{
      .outcomes = outcomes_,
      .malformed_rows = malformed_rows_,
      .latency_count = latency_.count(),
      .latency_mean_ns = latency_.mean(),
      .latency_p99_ns = latency_.percentile(0.99),
  };
}

void TelemetrySink::reset() {
  std::scoped_lock lock(mutex_);
  outcomes_.fill(0);
  malformed_rows_ = 0;
  latency_.reset();
}

}  // namespace telemetry
}  // namespace settlecore
