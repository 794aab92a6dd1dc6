#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "settlecore/common/types.hpp"
#include "settlecore/decimal/decimal.hpp"

namespace settlecore {
namespace ledger {

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// Case-insensitive, surrounding whitespace ignored.
[[nodiscard]] std::optional<TransactionKind> parse_kind(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(TransactionKind kind) noexcept;

struct Transaction {
  TransactionKind kind{TransactionKind::kDeposit};
  common::TransactionId id{0};
  common::ClientId client{0};
  std::optional<decimal::Decimal> amount{};  // deposits and withdrawals only

  [[nodiscard]] bool is_dispute_related() const noexcept {
    return kind == TransactionKind::kDispute || kind == TransactionKind::kResolve ||
           kind == TransactionKind::kChargeback;
  }
};

// "deposit tx=7 client=3 amount=1.5", for diagnostics.
[[nodiscard]] std::string describe(const Transaction& tx);

}  // namespace ledger
}  // namespace settlecore
