#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace settlecore {
namespace ledger {

// Result of routing one transaction. Rejections are terminal for that
// transaction only and never abort the run.
enum class Outcome : std::uint8_t {
  kApplied,
  kRejectedLocked,
  kRejectedMissingAmount,
  kRejectedNegativeAmount,
  kRejectedInsufficientFunds,
  kRejectedUnknownTransaction,
  kRejectedDisputeOnLocked,
  kRejectedAlreadyDisputed,
  kRejectedWithdrawalDispute,
  kRejectedNoDispute,
  kRejectedNotDisputed,
  kRejectedDuplicateId,
  kRejectedUnknownClient,
};

inline constexpr std::size_t kOutcomeCount = static_cast<std::size_t>(Outcome::kRejectedUnknownClient) + 1;

[[nodiscard]] constexpr std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kRejectedLocked:
      return "account_locked";
    case Outcome::kRejectedMissingAmount:
      return "missing_amount";
    case Outcome::kRejectedNegativeAmount:
      return "negative_amount";
    case Outcome::kRejectedInsufficientFunds:
      return "insufficient_funds";
    case Outcome::kRejectedUnknownTransaction:
      return "unknown_transaction";
    case Outcome::kRejectedDisputeOnLocked:
      return "dispute_on_locked_account";
    case Outcome::kRejectedAlreadyDisputed:
      return "already_disputed";
    case Outcome::kRejectedWithdrawalDispute:
      return "withdrawal_not_disputable";
    case Outcome::kRejectedNoDispute:
      return "no_dispute";
    case Outcome::kRejectedNotDisputed:
      return "not_under_dispute";
    case Outcome::kRejectedDuplicateId:
      return "duplicate_transaction_id";
    case Outcome::kRejectedUnknownClient:
      return "unknown_client";
  }
  return "unknown";
}

}  // namespace ledger
}  // namespace settlecore
