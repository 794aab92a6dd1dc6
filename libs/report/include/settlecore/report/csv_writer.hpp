#pragma once

#include <ostream>
#include <string_view>

#include "settlecore/snapshot/snapshot.hpp"

namespace settlecore {
namespace report {

inline constexpr std::string_view kAccountsHeader = "client,available,held,total,locked";

// Header is always written, even for an empty snapshot. Throws
// std::runtime_error if the stream goes bad.
void write_accounts_csv(const snapshot::Snapshot& snapshot, std::ostream& out);

}  // namespace report
}  // namespace settlecore
