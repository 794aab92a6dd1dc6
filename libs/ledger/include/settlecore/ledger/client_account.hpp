#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>

#include "settlecore/common/types.hpp"
#include "settlecore/decimal/decimal.hpp"
#include "settlecore/ledger/outcome.hpp"
#include "settlecore/ledger/transaction.hpp"

namespace settlecore {
namespace ledger {

enum class DisputeState : std::uint8_t {
  kDisputed,
  kResolved,
  kChargedBack,
};

// A settled deposit or withdrawal, kept as the basis for later disputes.
struct LedgerEntry {
  TransactionKind kind{TransactionKind::kDeposit};
  decimal::Decimal amount{};
};

// One client's balances. total == available + held after every call.
class ClientAccount {
 public:
  explicit ClientAccount(common::ClientId client) noexcept;

  // Deposit or withdrawal. Throws std::logic_error for dispute-related kinds.
  Outcome settle(const Transaction& tx);
  // Dispute, resolve or chargeback. Throws std::logic_error for settlement kinds.
  Outcome adjudicate(const Transaction& tx);

  [[nodiscard]] common::ClientId client_id() const noexcept { return client_; }
  [[nodiscard]] decimal::Decimal available() const noexcept { return available_; }
  [[nodiscard]] decimal::Decimal held() const noexcept { return held_; }
  [[nodiscard]] decimal::Decimal total() const noexcept { return total_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }

  [[nodiscard]] std::optional<LedgerEntry> ledger_entry(common::TransactionId id) const;
  [[nodiscard]] std::optional<DisputeState> dispute_state(common::TransactionId id) const;

 private:
  common::ClientId client_;
  decimal::Decimal available_{};
  decimal::Decimal held_{};
  decimal::Decimal total_{};
  bool locked_{false};

  std::unordered_map<common::TransactionId, LedgerEntry> ledger_{};
  // Entries are never pruned: a resolve or chargeback after a freeze still
  // needs to see that the dispute was opened beforehand.
  std::unordered_map<common::TransactionId, DisputeState> disputes_{};

  Outcome open_dispute(const Transaction& tx, const LedgerEntry& entry);
  Outcome close_dispute(const Transaction& tx, const LedgerEntry& entry);
};

}  // namespace ledger
}  // namespace settlecore
