#include "test_ledger.hpp"

#include <cassert>
#include <stdexcept>
#include "settlecore/ledger/client_account.hpp"

namespace settlecore::tests {

namespace {

using decimal::Decimal;
using ledger::ClientAccount;
using ledger::DisputeState;
using ledger::Outcome;
using ledger::Transaction;
using ledger::TransactionKind;

Transaction deposit(common::TransactionId id, double amount) {
  return {.kind = TransactionKind::kDeposit, .id = id, .client = 1, .amount = Decimal::from_double(amount)};
}

Transaction withdrawal(common::TransactionId id, double amount) {
  return {.kind = TransactionKind::kWithdrawal, .id = id, .client = 1, .amount = Decimal::from_double(amount)};
}

Transaction claim(TransactionKind kind, common::TransactionId id) {
  return {.kind = kind, .id = id, .client = 1, .amount = std::nullopt};
}

void expect_balances(const ClientAccount& account, double available, double held, double total) {
  assert(account.available() == Decimal::from_double(available));
  assert(account.held() == Decimal::from_double(held));
  assert(account.total() == Decimal::from_double(total));
  assert(account.total() == account.available() + account.held());
}

}  // namespace

void test_transaction_kind() {
  assert(ledger::parse_kind("deposit") == TransactionKind::kDeposit);
  assert(ledger::parse_kind("  Withdrawal ") == TransactionKind::kWithdrawal);
  assert(ledger::parse_kind("DISPUTE") == TransactionKind::kDispute);
  assert(ledger::parse_kind("resolve") == TransactionKind::kResolve);
  assert(ledger::parse_kind("ChargeBack") == TransactionKind::kChargeback);
  assert(!ledger::parse_kind("refund"));
  assert(!ledger::parse_kind(""));
  assert(ledger::to_string(TransactionKind::kChargeback) == "chargeback");
  assert(ledger::describe(deposit(7, 1.5)) == "deposit tx=7 client=1 amount=1.5");
  assert(ledger::describe(claim(TransactionKind::kResolve, 9)) == "resolve tx=9 client=1");

  assert(!deposit(1, 1.0).is_dispute_related());
  assert(!withdrawal(1, 1.0).is_dispute_related());
  assert(claim(TransactionKind::kDispute, 1).is_dispute_related());
  assert(claim(TransactionKind::kResolve, 1).is_dispute_related());
  assert(claim(TransactionKind::kChargeback, 1).is_dispute_related());
}

void test_settlement() {
  ClientAccount account{1};
  assert(account.settle(deposit(1, 100.0)) == Outcome::kApplied);
  expect_balances(account, 100.0, 0.0, 100.0);
  assert(!account.locked());

  const auto entry = account.ledger_entry(1);
  assert(entry.has_value());
  assert(entry->kind == TransactionKind::kDeposit);
  assert(entry->amount == Decimal::from_double(100.0));

  assert(account.settle(withdrawal(2, 30.0)) == Outcome::kApplied);
  expect_balances(account, 70.0, 0.0, 70.0);
  assert(account.ledger_entry(2)->kind == TransactionKind::kWithdrawal);

  // Exact balance can be withdrawn.
  assert(account.settle(withdrawal(3, 70.0)) == Outcome::kApplied);
  expect_balances(account, 0.0, 0.0, 0.0);

  // Zero deposits are valid and disputable.
  assert(account.settle(deposit(4, 0.0)) == Outcome::kApplied);
  assert(account.adjudicate(claim(TransactionKind::kDispute, 4)) == Outcome::kApplied);
  expect_balances(account, 0.0, 0.0, 0.0);
  assert(account.dispute_state(4) == DisputeState::kDisputed);

  // Boundary ids.
  ClientAccount edge{65'535};
  assert(edge.client_id() == 65'535);
  assert(edge.settle({.kind = TransactionKind::kDeposit,
                      .id = 4'294'967'295u,
                      .client = 65'535,
                      .amount = Decimal::from_raw(1)}) == Outcome::kApplied);
  assert(edge.ledger_entry(4'294'967'295u).has_value());
}

void test_settlement_rejections() {
  ClientAccount account{1};
  account.settle(deposit(1, 100.0));

  assert(account.settle(withdrawal(2, 150.0)) == Outcome::kRejectedInsufficientFunds);
  expect_balances(account, 100.0, 0.0, 100.0);
  assert(!account.ledger_entry(2));
  // A withdrawal that never settled cannot be disputed.
  assert(account.adjudicate(claim(TransactionKind::kDispute, 2)) == Outcome::kRejectedUnknownTransaction);

  assert(account.settle({.kind = TransactionKind::kDeposit, .id = 3, .client = 1, .amount = std::nullopt}) ==
         Outcome::kRejectedMissingAmount);
  assert(account.settle({.kind = TransactionKind::kWithdrawal, .id = 4, .client = 1, .amount = std::nullopt}) ==
         Outcome::kRejectedMissingAmount);
  assert(account.settle(deposit(5, -10.0)) == Outcome::kRejectedNegativeAmount);
  assert(account.settle(withdrawal(6, -10.0)) == Outcome::kRejectedNegativeAmount);
  expect_balances(account, 100.0, 0.0, 100.0);
  assert(!account.ledger_entry(3) && !account.ledger_entry(5) && !account.ledger_entry(6));
}

void test_dispute_lifecycle() {
  {
    ClientAccount account{1};
    account.settle(deposit(1, 100.0));
    assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kApplied);
    expect_balances(account, 0.0, 100.0, 100.0);
    assert(account.dispute_state(1) == DisputeState::kDisputed);

    assert(account.adjudicate(claim(TransactionKind::kResolve, 1)) == Outcome::kApplied);
    expect_balances(account, 100.0, 0.0, 100.0);
    assert(account.dispute_state(1) == DisputeState::kResolved);
    assert(!account.locked());
  }
  {
    ClientAccount account{1};
    account.settle(deposit(1, 100.0));
    account.settle(deposit(2, 50.0));
    assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kApplied);
    assert(account.adjudicate(claim(TransactionKind::kChargeback, 1)) == Outcome::kApplied);
    expect_balances(account, 50.0, 0.0, 50.0);
    assert(account.locked());
    assert(account.dispute_state(1) == DisputeState::kChargedBack);
  }
}

void test_dispute_rejections() {
  ClientAccount account{1};
  account.settle(deposit(1, 100.0));
  account.settle(withdrawal(2, 10.0));

  assert(account.adjudicate(claim(TransactionKind::kDispute, 99)) == Outcome::kRejectedUnknownTransaction);
  assert(account.adjudicate(claim(TransactionKind::kResolve, 99)) == Outcome::kRejectedUnknownTransaction);
  assert(account.adjudicate(claim(TransactionKind::kChargeback, 99)) == Outcome::kRejectedUnknownTransaction);

  assert(account.adjudicate(claim(TransactionKind::kDispute, 2)) == Outcome::kRejectedWithdrawalDispute);
  assert(!account.dispute_state(2));

  assert(account.adjudicate(claim(TransactionKind::kResolve, 1)) == Outcome::kRejectedNoDispute);
  assert(account.adjudicate(claim(TransactionKind::kChargeback, 1)) == Outcome::kRejectedNoDispute);
  expect_balances(account, 90.0, 0.0, 90.0);

  assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kApplied);
  assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kRejectedAlreadyDisputed);
  expect_balances(account, -10.0, 100.0, 90.0);

  assert(account.adjudicate(claim(TransactionKind::kResolve, 1)) == Outcome::kApplied);
  // Terminal: no re-dispute, no double resolve, no chargeback after resolve.
  assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kRejectedAlreadyDisputed);
  assert(account.adjudicate(claim(TransactionKind::kResolve, 1)) == Outcome::kRejectedNotDisputed);
  assert(account.adjudicate(claim(TransactionKind::kChargeback, 1)) == Outcome::kRejectedNotDisputed);
  expect_balances(account, 90.0, 0.0, 90.0);
  assert(account.dispute_state(1) == DisputeState::kResolved);
}

void test_freeze_semantics() {
  ClientAccount account{1};
  account.settle(deposit(1, 10.0));
  account.settle(deposit(2, 5.0));
  account.settle(deposit(3, 1.0));
  assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kApplied);
  assert(account.adjudicate(claim(TransactionKind::kDispute, 2)) == Outcome::kApplied);
  assert(account.adjudicate(claim(TransactionKind::kChargeback, 1)) == Outcome::kApplied);
  assert(account.locked());
  expect_balances(account, 1.0, 5.0, 6.0);

  // Settlements and new disputes are refused once frozen.
  assert(account.settle(deposit(4, 100.0)) == Outcome::kRejectedLocked);
  assert(account.settle(withdrawal(5, 1.0)) == Outcome::kRejectedLocked);
  assert(account.settle(deposit(6, -1.0)) == Outcome::kRejectedLocked);
  assert(account.adjudicate(claim(TransactionKind::kDispute, 3)) == Outcome::kRejectedDisputeOnLocked);
  assert(!account.ledger_entry(4));

  // The pre-freeze dispute can still complete.
  assert(account.adjudicate(claim(TransactionKind::kResolve, 2)) == Outcome::kApplied);
  expect_balances(account, 6.0, 0.0, 6.0);
  assert(account.adjudicate(claim(TransactionKind::kChargeback, 1)) == Outcome::kRejectedNotDisputed);
  assert(account.locked());
}

void test_negative_balances_after_dispute() {
  ClientAccount account{1};
  account.settle(deposit(1, 100.0));
  account.settle(withdrawal(2, 80.0));
  assert(account.adjudicate(claim(TransactionKind::kDispute, 1)) == Outcome::kApplied);
  expect_balances(account, -80.0, 100.0, 20.0);

  assert(account.adjudicate(claim(TransactionKind::kChargeback, 1)) == Outcome::kApplied);
  expect_balances(account, -80.0, 0.0, -80.0);
  assert(account.locked());
}

void test_contract_violations() {
  ClientAccount account{1};
  bool threw = false;
  try {
    (void)account.settle(claim(TransactionKind::kDispute, 1));
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)account.adjudicate(deposit(1, 1.0));
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  expect_balances(account, 0.0, 0.0, 0.0);
}

}  // namespace settlecore::tests
