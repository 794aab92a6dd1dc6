#include "settlecore/report/csv_writer.hpp"

#include <stdexcept>

namespace settlecore {
namespace report {

void write_accounts_csv(const snapshot::Snapshot& snapshot, std::ostream& out) {
  out << kAccountsHeader << '\n';
  for (const auto& record : snapshot.records()) {
    out << record.client << ','
        << record.available.to_string() << ','
        << record.held.to_string() << ','
        << record.total.to_string() << ','
        << (record.locked ? "true" : "false") << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
}

}  // namespace report
}  // namespace settlecore
