#include <strongbox/common/critical.hpp>
#include <strongbox/ledger/ledger.hpp>

#include <stdexcept>
#include <variant>

using namespace strongbox::schema;

namespace strongbox::ledger {

std::optional<vault_error_code> ledger::apply(
    const ledger_mutation_t& mutation) {
  return std::visit(
      overloaded{[&](const deposit_mutation_t& value) {
                   return deposit(value.account, value.asset, value.amount,
                                  value.value);
                 },
                 [&](const withdraw_mutation_t& value) {
                   return withdraw(value.account, value.asset, value.amount,
                                   value.value);
                 }},
      mutation);
}

std::optional<vault_error_code> ledger::deposit(
    const account_id_t& account,
    const asset_id_t& asset,
    const amount_t& amount,
    const accounting_value_t& value) {
  if (amount == 0) {
    return vault_error_code::zero_amount;
  }

  auto& balance = balances_[balance_key_t{account, asset}];
  auto next_balance = amount_t{};
  auto next_total = accounting_value_t{};
  try {
    next_balance = balance + amount;
    next_total = total_deposited_value_ + value;
  } catch (const std::overflow_error&) {
    strongbox::common::critical("ledger balance or running total overflow");
  }
  balance = next_balance;
  total_deposited_value_ = next_total;
  return std::nullopt;
}

std::optional<vault_error_code> ledger::withdraw(
    const account_id_t& account,
    const asset_id_t& asset,
    const amount_t& amount,
    const accounting_value_t& value) {
  if (amount == 0) {
    return vault_error_code::zero_amount;
  }

  auto found = balances_.find(balance_key_t{account, asset});
  if (found == std::end(balances_) || amount > found->second) {
    return vault_error_code::insufficient_balance;
  }
  if (value > total_deposited_value_) {
    return vault_error_code::arithmetic_overflow;
  }
  found->second -= amount;
  total_deposited_value_ -= value;
  return std::nullopt;
}

amount_t ledger::balance_of(const account_id_t& account,
                            const asset_id_t& asset) const {
  auto found = balances_.find(balance_key_t{account, asset});
  if (found == std::end(balances_)) {
    return amount_t{};
  }
  return found->second;
}

const accounting_value_t& ledger::total_deposited_value() const {
  return total_deposited_value_;
}

ledger_checkpoint_t ledger::checkpoint(const account_id_t& account,
                                       const asset_id_t& asset) const {
  return ledger_checkpoint_t{
      .account = account,
      .asset = asset,
      .existed = balances_.contains(balance_key_t{account, asset}),
      .balance = balance_of(account, asset),
      .total_deposited_value = total_deposited_value_};
}

void ledger::restore(const ledger_checkpoint_t& checkpoint) {
  auto key = balance_key_t{checkpoint.account, checkpoint.asset};
  if (checkpoint.existed) {
    balances_[key] = checkpoint.balance;
  } else {
    balances_.erase(key);
  }
  total_deposited_value_ = checkpoint.total_deposited_value;
}

void ledger::load_balance(const account_id_t& account,
                          const asset_id_t& asset,
                          const amount_t& balance) {
  balances_[balance_key_t{account, asset}] = balance;
}

void ledger::load_total(const accounting_value_t& total) {
  total_deposited_value_ = total;
}

const balance_map_t& ledger::entries() const {
  return balances_;
}

}  // namespace strongbox::ledger
