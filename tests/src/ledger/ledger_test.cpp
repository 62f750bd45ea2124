#include <gtest/gtest.h>
#include <strongbox/ledger/ledger.hpp>
#include <strongbox/testing/common.hpp>

#include <limits>

namespace {

using strongbox::schema::accounting_value_t;
using strongbox::schema::amount_t;
using strongbox::schema::vault_error_code;
using strongbox::testing::make_hash;

}  // namespace

TEST(ledger, deposit_then_withdraw_conserves_balance) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto asset = make_hash(50);

  EXPECT_FALSE(book.deposit(account, asset, amount_t{100},
                            accounting_value_t{40})
                   .has_value());
  EXPECT_FALSE(book.withdraw(account, asset, amount_t{30},
                             accounting_value_t{12})
                   .has_value());
  EXPECT_EQ(book.balance_of(account, asset), amount_t{70});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{28});
}

TEST(ledger, balances_are_isolated_per_account_and_asset) {
  auto book = strongbox::ledger::ledger{};
  auto alice = make_hash(1);
  auto bob = make_hash(2);
  auto token = make_hash(50);
  auto native = strongbox::schema::native_asset_id();

  ASSERT_FALSE(book.deposit(alice, token, amount_t{5}, accounting_value_t{5})
                   .has_value());
  EXPECT_EQ(book.balance_of(alice, token), amount_t{5});
  EXPECT_EQ(book.balance_of(alice, native), amount_t{0});
  EXPECT_EQ(book.balance_of(bob, token), amount_t{0});
}

TEST(ledger, overdraw_is_rejected_without_mutation) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto asset = make_hash(50);
  ASSERT_FALSE(book.deposit(account, asset, amount_t{100},
                            accounting_value_t{100})
                   .has_value());

  EXPECT_EQ(book.withdraw(account, asset, amount_t{101},
                          accounting_value_t{101}),
            vault_error_code::insufficient_balance);
  EXPECT_EQ(book.withdraw(make_hash(9), asset, amount_t{1},
                          accounting_value_t{1}),
            vault_error_code::insufficient_balance);
  EXPECT_EQ(book.balance_of(account, asset), amount_t{100});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{100});
}

TEST(ledger, zero_amounts_are_rejected) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto asset = make_hash(50);
  EXPECT_EQ(book.deposit(account, asset, amount_t{0}, accounting_value_t{0}),
            vault_error_code::zero_amount);
  EXPECT_EQ(book.withdraw(account, asset, amount_t{0}, accounting_value_t{0}),
            vault_error_code::zero_amount);
  EXPECT_TRUE(book.entries().empty());
}

TEST(ledger, running_total_tracks_mutation_values_not_balances) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto native = strongbox::schema::native_asset_id();

  // Deposited at one rate, withdrawn at a lower one.
  ASSERT_FALSE(book.deposit(account, native, amount_t{10},
                            accounting_value_t{2000})
                   .has_value());
  ASSERT_FALSE(book.withdraw(account, native, amount_t{10},
                             accounting_value_t{1500})
                   .has_value());
  EXPECT_EQ(book.balance_of(account, native), amount_t{0});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{500});
}

TEST(ledger, withdraw_valued_above_running_total_is_rejected) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto native = strongbox::schema::native_asset_id();
  ASSERT_FALSE(book.deposit(account, native, amount_t{10},
                            accounting_value_t{1000})
                   .has_value());

  EXPECT_EQ(book.withdraw(account, native, amount_t{10},
                          accounting_value_t{1001}),
            vault_error_code::arithmetic_overflow);
  EXPECT_EQ(book.balance_of(account, native), amount_t{10});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{1000});
}

TEST(ledger, apply_dispatches_on_mutation_kind) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto asset = make_hash(50);

  EXPECT_FALSE(book.apply(strongbox::schema::deposit_mutation_t{
                              .account = account,
                              .asset = asset,
                              .amount = amount_t{9},
                              .value = accounting_value_t{3}})
                   .has_value());
  EXPECT_FALSE(book.apply(strongbox::schema::withdraw_mutation_t{
                              .account = account,
                              .asset = asset,
                              .amount = amount_t{4},
                              .value = accounting_value_t{1}})
                   .has_value());
  EXPECT_EQ(book.balance_of(account, asset), amount_t{5});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{2});
}

TEST(ledger, restore_reverts_to_checkpoint) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto asset = make_hash(50);
  ASSERT_FALSE(book.deposit(account, asset, amount_t{100},
                            accounting_value_t{100})
                   .has_value());

  auto checkpoint = book.checkpoint(account, asset);
  ASSERT_FALSE(book.withdraw(account, asset, amount_t{60},
                             accounting_value_t{60})
                   .has_value());
  book.restore(checkpoint);

  EXPECT_EQ(book.balance_of(account, asset), amount_t{100});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{100});
}

TEST(ledger, restore_drops_rows_created_after_checkpoint) {
  auto book = strongbox::ledger::ledger{};
  auto account = make_hash(1);
  auto asset = make_hash(50);

  auto checkpoint = book.checkpoint(account, asset);
  EXPECT_FALSE(checkpoint.existed);
  ASSERT_FALSE(book.deposit(account, asset, amount_t{5}, accounting_value_t{5})
                   .has_value());
  book.restore(checkpoint);

  EXPECT_TRUE(book.entries().empty());
  EXPECT_EQ(book.balance_of(account, asset), amount_t{0});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{0});
}

TEST(ledger, load_rebuilds_rows_and_total) {
  auto book = strongbox::ledger::ledger{};
  book.load_balance(make_hash(1), make_hash(50), amount_t{7});
  book.load_total(accounting_value_t{11});
  EXPECT_EQ(book.entries().size(), 1u);
  EXPECT_EQ(book.balance_of(make_hash(1), make_hash(50)), amount_t{7});
  EXPECT_EQ(book.total_deposited_value(), accounting_value_t{11});
}

TEST(ledger_death, balance_overflow_is_fatal) {
  EXPECT_DEATH(
      {
        auto book = strongbox::ledger::ledger{};
        auto account = make_hash(1);
        auto asset = make_hash(50);
        (void)book.deposit(account, asset,
                           (std::numeric_limits<amount_t>::max)(),
                           accounting_value_t{0});
        (void)book.deposit(account, asset, amount_t{1}, accounting_value_t{0});
      },
      "");
}
