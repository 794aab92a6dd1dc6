#include "settlecore/ledger/client_account.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace settlecore {
namespace ledger {

namespace {

Outcome reject(Outcome outcome, common::ClientId client, const Transaction& tx) {
  spdlog::warn("client {}: rejected {} ({})", client, describe(tx), to_string(outcome));
  return outcome;
}

}  // namespace

ClientAccount::ClientAccount(common::ClientId client) noexcept : client_(client) {}

Outcome ClientAccount::settle(const Transaction& tx) {
  if (tx.is_dispute_related()) {
    throw std::logic_error("settle called with dispute-related transaction: " + describe(tx));
  }

  if (locked_) {
    return reject(Outcome::kRejectedLocked, client_, tx);
  }
  if (!tx.amount) {
    return reject(Outcome::kRejectedMissingAmount, client_, tx);
  }
  const decimal::Decimal amount = *tx.amount;
  if (amount.is_negative()) {
    return reject(Outcome::kRejectedNegativeAmount, client_, tx);
  }

  if (tx.kind == TransactionKind::kDeposit) {
    available_ += amount;
    total_ += amount;
  } else {
    // Failed withdrawals are never recorded, so they can never be disputed.
    if (available_ < amount) {
      return reject(Outcome::kRejectedInsufficientFunds, client_, tx);
    }
    available_ -= amount;
    total_ -= amount;
  }

  ledger_.insert_or_assign(tx.id, LedgerEntry{.kind = tx.kind, .amount = amount});
  spdlog::debug("client {}: applied {}", client_, describe(tx));
  return Outcome::kApplied;
}

Outcome ClientAccount::adjudicate(const Transaction& tx) {
  if (!tx.is_dispute_related()) {
    throw std::logic_error("adjudicate called with settlement transaction: " + describe(tx));
  }

  const auto it = ledger_.find(tx.id);
  if (it == ledger_.end()) {
    return reject(Outcome::kRejectedUnknownTransaction, client_, tx);
  }

  if (tx.kind == TransactionKind::kDispute) {
    return open_dispute(tx, it->second);
  }
  return close_dispute(tx, it->second);
}

Outcome ClientAccount::open_dispute(const Transaction& tx, const LedgerEntry& entry) {
  if (locked_) {
    return reject(Outcome::kRejectedDisputeOnLocked, client_, tx);
  }
  if (disputes_.contains(tx.id)) {
    return reject(Outcome::kRejectedAlreadyDisputed, client_, tx);
  }
  if (entry.kind != TransactionKind::kDeposit) {
    return reject(Outcome::kRejectedWithdrawalDispute, client_, tx);
  }

  // available may go negative if the deposit was already spent.
  available_ -= entry.amount;
  held_ += entry.amount;
  disputes_.emplace(tx.id, DisputeState::kDisputed);
  spdlog::debug("client {}: applied {}", client_, describe(tx));
  return Outcome::kApplied;
}

Outcome ClientAccount::close_dispute(const Transaction& tx, const LedgerEntry& entry) {
  const auto it = disputes_.find(tx.id);
  if (it == disputes_.end()) {
    return reject(Outcome::kRejectedNoDispute, client_, tx);
  }
  if (it->second != DisputeState::kDisputed) {
    return reject(Outcome::kRejectedNotDisputed, client_, tx);
  }

  held_ -= entry.amount;
  if (tx.kind == TransactionKind::kResolve) {
    available_ += entry.amount;
    it->second = DisputeState::kResolved;
  } else {
    total_ -= entry.amount;
    locked_ = true;
    it->second = DisputeState::kChargedBack;
  }
  spdlog::debug("client {}: applied {}", client_, describe(tx));
  return Outcome::kApplied;
}

std::optional<LedgerEntry> ClientAccount::ledger_entry(common::TransactionId id) const {
  if (auto it = ledger_.find(id); it != ledger_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<DisputeState> ClientAccount::dispute_state(common::TransactionId id) const {
  if (auto it = disputes_.find(id); it != disputes_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace ledger
}  // namespace settlecore
