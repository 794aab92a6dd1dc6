#include "settlecore/engine/payments_engine.hpp"

#include <spdlog/spdlog.h>

#include "settlecore/common/time_utils.hpp"

namespace settlecore {
namespace engine {

PaymentsEngine::PaymentsEngine(telemetry::TelemetrySink* telemetry) : telemetry_(telemetry) {}

ledger::Outcome PaymentsEngine::process(const ledger::Transaction& tx) {
  const auto started = common::now_steady();
  const ledger::Outcome outcome = route(tx);

  ++stats_.processed;
  if (outcome == ledger::Outcome::kApplied) {
    ++stats_.applied;
  } else {
    ++stats_.rejected;
  }

  if (telemetry_) {
    telemetry_->record_outcome(outcome);
    telemetry_->record_latency(common::now_steady() - started);
  }
  return outcome;
}

ledger::Outcome PaymentsEngine::route(const ledger::Transaction& tx) {
  if (tx.is_dispute_related()) {
    auto it = accounts_.find(tx.client);
    if (it == accounts_.end()) {
      spdlog::warn("rejected {} (no account for client)", ledger::describe(tx));
      return ledger::Outcome::kRejectedUnknownClient;
    }
    return it->second.adjudicate(tx);
  }

  // Duplicates are dropped before they reach any account, so the ledger
  // entry of the first occurrence is never overwritten.
  if (!processed_ids_.insert(tx.id).second) {
    spdlog::warn("rejected {} (duplicate transaction id)", ledger::describe(tx));
    return ledger::Outcome::kRejectedDuplicateId;
  }

  auto it = accounts_.try_emplace(tx.client, tx.client).first;
  return it->second.settle(tx);
}

snapshot::Snapshot PaymentsEngine::snapshot() const {
  return snapshot::Snapshot::from_accounts(accounts_);
}

const ledger::ClientAccount* PaymentsEngine::account(common::ClientId client) const {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace engine
}  // namespace settlecore
