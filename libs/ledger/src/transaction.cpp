#include "settlecore/ledger/transaction.hpp"

#include <array>
#include <cctype>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace settlecore {
namespace ledger {

namespace {

constexpr std::array<std::pair<std::string_view, TransactionKind>, 5> kKindNames{{
    {"deposit", TransactionKind::kDeposit},
    {"withdrawal", TransactionKind::kWithdrawal},
    {"dispute", TransactionKind::kDispute},
    {"resolve", TransactionKind::kResolve},
    {"chargeback", TransactionKind::kChargeback},
}};

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<TransactionKind> parse_kind(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  for (const auto& [name, kind] : kKindNames) {
    if (iequals(text, name)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view to_string(TransactionKind kind) noexcept {
  for (const auto& [name, candidate] : kKindNames) {
    if (candidate == kind) {
      return name;
    }
  }
  return "unknown";
}

std::string describe(const Transaction& tx) {
  if (tx.amount) {
    return fmt::format("{} tx={} client={} amount={}", to_string(tx.kind), tx.id, tx.client, tx.amount->to_string());
  }
  return fmt::format("{} tx={} client={}", to_string(tx.kind), tx.id, tx.client);
}

}  // namespace ledger
}  // namespace settlecore
