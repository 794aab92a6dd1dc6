#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>

#include "settlecore/ledger/outcome.hpp"

namespace settlecore {
namespace telemetry {

// Log2-bucketed latency histogram, 1ns to ~1s. O(1) record.
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

struct Summary {
  std::array<std::uint64_t, ledger::kOutcomeCount> outcomes{};
  std::uint64_t malformed_rows{0};
  std::uint64_t latency_count{0};
  double latency_mean_ns{0.0};
  double latency_p99_ns{0.0};

  [[nodiscard]] std::uint64_t count(ledger::Outcome outcome) const noexcept {
    return outcomes[static_cast<std::size_t>(outcome)];
  }
  [[nodiscard]] std::uint64_t rejected() const noexcept;
};

// Thread-safe: the reader thread records malformed rows while the engine
// thread records outcomes.
class TelemetrySink {
 public:
  void record_outcome(ledger::Outcome outcome);
  void record_malformed_row();
  void record_latency(std::chrono::nanoseconds latency);

  [[nodiscard]] Summary summary() const;
  void reset();

 private:
  mutable std::mutex mutex_;
  std::array<std::uint64_t, ledger::kOutcomeCount> outcomes_{};
  std::uint64_t malformed_rows_{0};
  StreamingHistogram latency_{};
};

}  // namespace telemetry
}  // namespace settlecore
