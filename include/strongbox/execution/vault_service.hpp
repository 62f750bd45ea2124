#pragma once

#include <strongbox/ledger/ledger.hpp>
#include <strongbox/ledger/transfer_gateway.hpp>
#include <strongbox/ledger/value_converter.hpp>
#include <strongbox/schema/operation_result.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <strongbox/schema/vault_event.hpp>
#include <strongbox/schema/vault_info.hpp>
#include <strongbox/schema/vault_limits.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

namespace strongbox::execution {

/// Receives every event of a committed operation, in emission order.
using event_sink_t =
    std::function<void(const strongbox::schema::vault_event_t& event)>;

/// Custodial vault: the public deposit/withdraw/balance surface.
///
/// Every operation runs as one atomic attempt under an exclusive lock:
/// validate, convert, guard, mutate the ledger, transfer, commit to storage,
/// notify. The ledger is mutated strictly before the external transfer and is
/// restored from a checkpoint if the transfer fails, so a rejected operation
/// leaves balances, the running total and the committed state untouched.
///
/// Calls that re-enter the service from inside a transfer callback cannot
/// mutate: they are rejected with reentrant_call. Re-entrant reads see the
/// committed (pre-operation) values.
class vault_service final {
 public:
  /// Construct the service over `storage` and reload any persisted ledger.
  ///
  /// `limits` are fixed for the service's lifetime.
  explicit vault_service(
      strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
          storage,
      const strongbox::schema::vault_limits_t& limits,
      strongbox::ledger::value_converter converter,
      strongbox::ledger::transfer_gateway_t transfer);

  vault_service(const vault_service&) = delete;
  vault_service& operator=(const vault_service&) = delete;

  /// Credit native currency that arrived with the call. There is no pull
  /// transfer for the native path.
  strongbox::schema::operation_result_t deposit_native(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::amount_t& amount);

  /// Pull a pre-authorized non-native asset into custody and credit it.
  /// The native asset id is rejected with wrong_deposit_path.
  strongbox::schema::operation_result_t deposit_asset(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset,
      const strongbox::schema::amount_t& amount);

  /// Debit `amount` and push it out to the account.
  strongbox::schema::operation_result_t withdraw(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::amount_t balance_of(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset) const;

  strongbox::schema::accounting_value_t total_deposited_value() const;

  /// Committed sequence, state root, running total and limits.
  strongbox::schema::vault_info_t info() const;

  /// Install the observability sink. Events reach it only after commit; a
  /// sink that throws is logged and does not affect the committed result.
  /// Returns false, leaving the current sink in place, when called from
  /// inside an operation.
  bool set_event_sink(event_sink_t sink);

 private:
  strongbox::schema::operation_result_t deposit(
      const strongbox::schema::account_id_t& account,
      const strongbox::schema::asset_id_t& asset,
      const strongbox::schema::amount_t& amount,
      bool pull);

  /// Run the external transfer; any exception or missing callback counts as
  /// a failed transfer.
  bool transfer(const strongbox::ledger::transfer_function_t& function,
                std::string_view direction,
                const strongbox::schema::account_id_t& account,
                const strongbox::schema::asset_id_t& asset,
                const strongbox::schema::amount_t& amount) const;

  /// Persist the mutated balance row, the running total and the next
  /// committed state in one batch.
  void commit(const strongbox::schema::ledger_mutation_t& mutation);

  void notify(strongbox::schema::operation_result_t& result,
              strongbox::schema::vault_event_t event) const;

  bool reentrant() const;

  /// Reload balances, the running total and the committed state.
  void load_persisted_state();

  mutable std::mutex mutex_;
  std::atomic<std::thread::id> active_thread_{};
  std::optional<strongbox::ledger::ledger_checkpoint_t> in_flight_;
  strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
      storage_;
  const strongbox::schema::vault_limits_t limits_;
  strongbox::ledger::value_converter converter_;
  strongbox::ledger::transfer_gateway_t transfer_;
  strongbox::ledger::ledger ledger_;
  event_sink_t event_sink_;
  uint64_t sequence_{};
  strongbox::schema::hash32_t state_root_{};
};

}  // namespace strongbox::execution
