#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "settlecore/common/types.hpp"
#include "settlecore/decimal/decimal.hpp"
#include "settlecore/ledger/client_account.hpp"

namespace settlecore {
namespace snapshot {

struct AccountRecord {
  common::ClientId client{0};
  decimal::Decimal available{};
  decimal::Decimal held{};
  decimal::Decimal total{};
  bool locked{false};
};

// Final account states in ascending client order.
class Snapshot {
 public:
  Snapshot() = default;

  [[nodiscard]] static Snapshot from_accounts(const std::map<common::ClientId, ledger::ClientAccount>& accounts);

  [[nodiscard]] const std::vector<AccountRecord>& records() const noexcept { return records_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
  [[nodiscard]] bool empty() const noexcept { return records_.empty(); }
  [[nodiscard]] const AccountRecord* find(common::ClientId client) const noexcept;

 private:
  std::vector<AccountRecord> records_{};
};

}  // namespace snapshot
}  // namespace settlecore
