#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <thread>

#include "settlecore/common/bounded_channel.hpp"
#include "settlecore/engine/payments_engine.hpp"
#include "settlecore/ledger/transaction.hpp"
#include "settlecore/snapshot/snapshot.hpp"
#include "settlecore/telemetry/telemetry_sink.hpp"

namespace settlecore {
namespace engine {

// Runs a PaymentsEngine on a dedicated consumer thread fed by a bounded FIFO
// channel. Any number of producers may submit; transactions are applied in
// the order they entered the channel.
class EngineService {
 public:
  struct Config {
    std::size_t queue_depth{128};
  };

  explicit EngineService(const Config& config, telemetry::TelemetrySink* telemetry = nullptr);
  EngineService(const EngineService&) = delete;
  EngineService& operator=(const EngineService&) = delete;
  EngineService(EngineService&&) = delete;
  EngineService& operator=(EngineService&&) = delete;
  ~EngineService();

  void start();
  // Blocks while the queue is full. Returns false once the service is closed.
  bool submit(ledger::Transaction tx);
  // Signals end of input. The consumer drains what is queued, then stops.
  void close();
  // Closes if needed, waits for the consumer and returns the final state.
  // Rethrows anything the consumer thread threw.
  snapshot::Snapshot join();

  // Only stable once join() has returned.
  [[nodiscard]] const PaymentsEngine::Stats& stats() const noexcept { return engine_.stats(); }

 private:
  common::BoundedChannel<ledger::Transaction> channel_;
  PaymentsEngine engine_;
  std::thread consumer_{};
  std::exception_ptr failure_{};
  std::optional<snapshot::Snapshot> result_{};

  void run();
};

}  // namespace engine
}  // namespace settlecore
