#pragma once

#include <strongbox/schema/ledger_mutation.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <map>
#include <optional>
#include <utility>

namespace strongbox::ledger {

using balance_key_t =
    std::pair<strongbox::schema::account_id_t, strongbox::schema::asset_id_t>;
using balance_map_t = std::map<balance_key_t, strongbox::schema::amount_t>;

/// Pre-mutation image of one balance row and the running total. A row that
/// did not exist yet is removed again on restore.
struct ledger_checkpoint_t final {
  strongbox::schema::account_id_t account{};
  strongbox::schema::asset_id_t asset{};
  bool existed{};
  strongbox::schema::amount_t balance{};
  strongbox::schema::accounting_value_t total_deposited_value{};
};

/// In-memory balance book: (account, asset) -> balance plus the running
/// total of deposited accounting value.
///
/// The running total is maintained from the value carried by each mutation,
/// never recomputed from balances. Deposits add their deposit-time value and
/// withdrawals subtract their withdrawal-time value, so the total drifts from
/// a re-valuation of the balances whenever the native rate moves.
///
/// The ledger does no limit enforcement and no conversion. Balance or total
/// overflow is fatal.
class ledger final {
 public:
  ledger() = default;

  std::optional<strongbox::schema::vault_error_code> apply(
      const strongbox::schema::ledger_mutation_t& mutation);

  std::optional<strongbox::schema::vault_error_code> deposit(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset,
      const strongbox::schema::amount_t& amount,
      const strongbox::schema::accounting_value_t& value);

  std::optional<strongbox::schema::vault_error_code> withdraw(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset,
      const strongbox::schema::amount_t& amount,
      const strongbox::schema::accounting_value_t& value);

  /// 0 for pairs that were never credited.
  strongbox::schema::amount_t balance_of(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset) const;

  const strongbox::schema::accounting_value_t& total_deposited_value() const;

  ledger_checkpoint_t checkpoint(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset) const;
  void restore(const ledger_checkpoint_t& checkpoint);

  /// Used when rebuilding state from storage.
  void load_balance(const strongbox::schema::account_id_t& account,
                    const strongbox::schema::asset_id_t& asset,
                    const strongbox::schema::amount_t& balance);
  void load_total(const strongbox::schema::accounting_value_t& total);

  const balance_map_t& entries() const;

 private:
  balance_map_t balances_;
  strongbox::schema::accounting_value_t total_deposited_value_{};
};

}  // namespace strongbox::ledger
