#pragma once

#include <cstdint>
#include <map>
#include <unordered_set>

#include "settlecore/common/types.hpp"
#include "settlecore/ledger/client_account.hpp"
#include "settlecore/ledger/outcome.hpp"
#include "settlecore/ledger/transaction.hpp"
#include "settlecore/snapshot/snapshot.hpp"
#include "settlecore/telemetry/telemetry_sink.hpp"

namespace settlecore {
namespace engine {

// Single-writer aggregation over all client accounts. Not thread-safe; one
// consumer owns it (see EngineService).
class PaymentsEngine {
 public:
  struct Stats {
    std::uint64_t processed{0};
    std::uint64_t applied{0};
    std::uint64_t rejected{0};
  };

  explicit PaymentsEngine(telemetry::TelemetrySink* telemetry = nullptr);

  ledger::Outcome process(const ledger::Transaction& tx);

  [[nodiscard]] snapshot::Snapshot snapshot() const;
  [[nodiscard]] const ledger::ClientAccount* account(common::ClientId client) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  telemetry::TelemetrySink* telemetry_;
  Stats stats_{};

  // Ordered so the snapshot comes out sorted by client.
  std::map<common::ClientId, ledger::ClientAccount> accounts_{};
  // Transaction ids are unique across clients, so this lives here rather
  // than in any one account.
  std::unordered_set<common::TransactionId> processed_ids_{};

  ledger::Outcome route(const ledger::Transaction& tx);
};

}  // namespace engine
}  // namespace settlecore
