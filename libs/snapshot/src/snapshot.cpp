#include "settlecore/snapshot/snapshot.hpp"

#include <algorithm>

namespace settlecore {
namespace snapshot {

Snapshot Snapshot::from_accounts(const std::map<common::ClientId, ledger::ClientAccount>& accounts) {
  Snapshot snapshot;
  snapshot.records_.reserve(accounts.size());
  for (const auto& [client, account] : accounts) {
    snapshot.records_.push_back(AccountRecord{
        .client = client,
        .available = account.available(),
        .held = account.held(),
        .total = account.total(),
        .locked = account.locked(),
    });
  }
  return snapshot;
}

const AccountRecord* Snapshot::find(common::ClientId client) const noexcept {
  auto it = std::lower_bound(records_.begin(), records_.end(), client,
                             [](const AccountRecord& record, common::ClientId id) { return record.client < id; });
  if (it == records_.end() || it->client != client) {
    return nullptr;
  }
  return &*it;
}

}  // namespace snapshot
}  // namespace settlecore
