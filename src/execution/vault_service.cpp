#include <spdlog/spdlog.h>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/execution/vault_service.hpp>
#include <strongbox/ledger/limit_guard.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>
#include <exception>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

using namespace strongbox::schema;

namespace {

using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;

inline constexpr auto kDepositCodespace = std::string_view{"strongbox.deposit"};
inline constexpr auto kWithdrawCodespace =
    std::string_view{"strongbox.withdraw"};

/// Marks the calling thread as the owner of the operation in flight.
class operation_scope final {
 public:
  explicit operation_scope(std::atomic<std::thread::id>& owner)
      : owner_{owner} {
    owner_ = std::this_thread::get_id();
  }
  ~operation_scope() { owner_ = std::thread::id{}; }

  operation_scope(const operation_scope&) = delete;
  operation_scope& operator=(const operation_scope&) = delete;

 private:
  std::atomic<std::thread::id>& owner_;
};

std::string short_id(const hash32_t& id) {
  return to_hex(id).substr(0, 16);
}

operation_result_t reject(const vault_error_code code,
                          const std::string_view codespace,
                          const account_id_t& account,
                          std::string info = {}) {
  spdlog::warn("Rejected {} for account {}: {}", codespace, short_id(account),
               to_string(code));
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

hash32_t fold_state_root(const hash32_t& seed,
                         const uint64_t sequence,
                         const ledger_mutation_t& mutation) {
  auto material = bytes_t{};
  material.insert(std::end(material), std::begin(seed), std::end(seed));

  auto encoder = encoder_t{};
  std::visit(
      [&](const auto& value) {
        auto kind = static_cast<uint8_t>(mutation.index());
        encoder.encode(std::tuple{sequence, kind, value.account, value.asset,
                                  make_word(value.amount),
                                  make_word(value.value)},
                       material);
      },
      mutation);
  return strongbox::blake3::hash(bytes_view_t{material.data(), material.size()});
}

}  // namespace

namespace strongbox::execution {

vault_service::vault_service(
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
        storage,
    const vault_limits_t& limits,
    strongbox::ledger::value_converter converter,
    strongbox::ledger::transfer_gateway_t transfer)
    : storage_{storage},
      limits_{limits},
      converter_{std::move(converter)},
      transfer_{std::move(transfer)} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (converter_.max_reading_age() == 0) {
    spdlog::warn("Oracle staleness check disabled");
  }
  spdlog::info(
      "Vault ready at sequence {} (cap {}, withdraw limit {}, total {})",
      sequence_, limits_.max_total_value.str(),
      limits_.max_withdraw_value.str(), ledger_.total_deposited_value().str());
}

operation_result_t vault_service::deposit_native(const account_id_t& account,
                                                 const amount_t& amount) {
  return deposit(account, native_asset_id(), amount, false);
}

operation_result_t vault_service::deposit_asset(const account_id_t& account,
                                                const asset_id_t& asset,
                                                const amount_t& amount) {
  return deposit(account, asset, amount, true);
}

operation_result_t vault_service::deposit(const account_id_t& account,
                                          const asset_id_t& asset,
                                          const amount_t& amount,
                                          const bool pull) {
  if (reentrant()) {
    return reject(vault_error_code::reentrant_call, kDepositCodespace,
                  account);
  }
  auto lock = std::scoped_lock{mutex_};
  auto scope = operation_scope{active_thread_};

  if (amount == 0) {
    return reject(vault_error_code::zero_amount, kDepositCodespace, account);
  }
  if (pull && is_native_asset(asset)) {
    return reject(vault_error_code::wrong_deposit_path, kDepositCodespace,
                  account, "native currency must use deposit_native");
  }

  auto conversion = converter_.value_of(asset, amount);
  if (conversion.error) {
    return reject(*conversion.error, kDepositCodespace, account);
  }
  if (auto error = strongbox::ledger::check_cap(
          ledger_.total_deposited_value(), conversion.value,
          limits_.max_total_value)) {
    return reject(*error, kDepositCodespace, account,
                  "deposit value " + conversion.value.str());
  }

  auto mutation = ledger_mutation_t{deposit_mutation_t{.account = account,
                                                       .asset = asset,
                                                       .amount = amount,
                                                       .value = conversion.value}};
  in_flight_ = ledger_.checkpoint(account, asset);
  if (auto error = ledger_.apply(mutation)) {
    in_flight_.reset();
    return reject(*error, kDepositCodespace, account);
  }
  if (pull && !transfer(transfer_.pull, "pull", account, asset, amount)) {
    ledger_.restore(*in_flight_);
    in_flight_.reset();
    return reject(vault_error_code::transfer_failed, kDepositCodespace,
                  account);
  }
  in_flight_.reset();
  commit(mutation);

  auto result = operation_result_t{};
  result.info = "deposit committed";
  result.codespace = std::string{kDepositCodespace};
  result.value = conversion.value;
  notify(result, deposit_completed_t{.account = account,
                                     .asset = asset,
                                     .amount = amount,
                                     .accounting_value = conversion.value});
  notify(result,
         balance_changed_t{.account = account,
                           .asset = asset,
                           .new_balance = ledger_.balance_of(account, asset)});
  spdlog::info("Deposit {} of asset {} for account {} valued {} (seq {})",
               amount.str(), short_id(asset), short_id(account),
               conversion.value.str(), sequence_);
  return result;
}

operation_result_t vault_service::withdraw(const account_id_t& account,
                                           const asset_id_t& asset,
                                           const amount_t& amount) {
  if (reentrant()) {
    return reject(vault_error_code::reentrant_call, kWithdrawCodespace,
                  account);
  }
  auto lock = std::scoped_lock{mutex_};
  auto scope = operation_scope{active_thread_};

  if (amount == 0) {
    return reject(vault_error_code::zero_amount, kWithdrawCodespace, account);
  }

  auto conversion = converter_.value_of(asset, amount);
  if (conversion.error) {
    return reject(*conversion.error, kWithdrawCodespace, account);
  }
  if (auto error = strongbox::ledger::check_withdraw_limit(
          conversion.value, limits_.max_withdraw_value)) {
    return reject(*error, kWithdrawCodespace, account,
                  "withdraw value " + conversion.value.str());
  }

  auto mutation =
      ledger_mutation_t{withdraw_mutation_t{.account = account,
                                            .asset = asset,
                                            .amount = amount,
                                            .value = conversion.value}};
  in_flight_ = ledger_.checkpoint(account, asset);
  if (auto error = ledger_.apply(mutation)) {
    in_flight_.reset();
    return reject(*error, kWithdrawCodespace, account);
  }
  if (!transfer(transfer_.push, "push", account, asset, amount)) {
    ledger_.restore(*in_flight_);
    in_flight_.reset();
    return reject(vault_error_code::transfer_failed, kWithdrawCodespace,
                  account);
  }
  in_flight_.reset();
  commit(mutation);

  auto result = operation_result_t{};
  result.info = "withdraw committed";
  result.codespace = std::string{kWithdrawCodespace};
  result.value = conversion.value;
  notify(result, withdraw_completed_t{
                     .account = account, .asset = asset, .amount = amount});
  notify(result,
         balance_changed_t{.account = account,
                           .asset = asset,
                           .new_balance = ledger_.balance_of(account, asset)});
  spdlog::info("Withdraw {} of asset {} for account {} valued {} (seq {})",
               amount.str(), short_id(asset), short_id(account),
               conversion.value.str(), sequence_);
  return result;
}

amount_t vault_service::balance_of(const account_id_t& account,
                                   const asset_id_t& asset) const {
  if (reentrant()) {
    // The mutex is already held further up this thread's stack.
    if (in_flight_ && in_flight_->account == account &&
        in_flight_->asset == asset) {
      return in_flight_->balance;
    }
    return ledger_.balance_of(account, asset);
  }
  auto lock = std::scoped_lock{mutex_};
  return ledger_.balance_of(account, asset);
}

accounting_value_t vault_service::total_deposited_value() const {
  if (reentrant()) {
    if (in_flight_) {
      return in_flight_->total_deposited_value;
    }
    return ledger_.total_deposited_value();
  }
  auto lock = std::scoped_lock{mutex_};
  return ledger_.total_deposited_value();
}

vault_info_t vault_service::info() const {
  auto lock = std::unique_lock{mutex_, std::defer_lock};
  auto nested = reentrant();
  if (!nested) {
    lock.lock();
  }
  auto result = vault_info_t{};
  result.sequence = sequence_;
  result.state_root = state_root_;
  result.total_deposited_value = nested && in_flight_
                                     ? in_flight_->total_deposited_value
                                     : ledger_.total_deposited_value();
  result.limits = limits_;
  return result;
}

bool vault_service::set_event_sink(event_sink_t sink) {
  if (reentrant()) {
    spdlog::warn("Ignoring event sink change from inside an operation");
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
  return true;
}

bool vault_service::transfer(
    const strongbox::ledger::transfer_function_t& function,
    const std::string_view direction,
    const account_id_t& account,
    const asset_id_t& asset,
    const amount_t& amount) const {
  if (!function) {
    spdlog::error("No {} transfer handler installed", direction);
    return false;
  }
  try {
    if (function(account, asset, amount)) {
      return true;
    }
    spdlog::error("{} transfer of {} (asset {}) failed for account {}",
                  direction, amount.str(), short_id(asset), short_id(account));
  } catch (const std::exception& ex) {
    spdlog::error("{} transfer for account {} threw: {}", direction,
                  short_id(account), ex.what());
  }
  return false;
}

void vault_service::commit(const ledger_mutation_t& mutation) {
  auto [account, asset] = std::visit(
      [](const auto& value) {
        return strongbox::ledger::balance_key_t{value.account, value.asset};
      },
      mutation);

  auto encoder = encoder_t{};
  auto next_sequence = sequence_ + 1;
  auto next_root = fold_state_root(state_root_, next_sequence, mutation);
  auto entries = std::vector<strongbox::storage::key_value_entry_t>{};
  entries.emplace_back(
      strongbox::schema::key::make_balance_key(account, asset),
      encoder.encode(make_word(ledger_.balance_of(account, asset))));
  entries.emplace_back(
      strongbox::schema::key::make_total_key(),
      encoder.encode(make_word(ledger_.total_deposited_value())));
  storage_.commit(strongbox::storage::committed_state{
                      .sequence = next_sequence, .state_root = next_root},
                  entries);

  sequence_ = next_sequence;
  state_root_ = next_root;
}

void vault_service::notify(operation_result_t& result,
                           vault_event_t event) const {
  if (event_sink_) {
    try {
      event_sink_(event);
    } catch (const std::exception& ex) {
      spdlog::error("Event sink failed after commit: {}", ex.what());
    }
  }
  result.events.push_back(std::move(event));
}

bool vault_service::reentrant() const {
  return active_thread_.load() == std::this_thread::get_id();
}

void vault_service::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  if (auto committed = storage_.load_committed_state()) {
    sequence_ = committed->sequence;
    state_root_ = committed->state_root;
  }

  auto encoder = encoder_t{};
  auto rows = storage_.list_by_prefix(
      make_bytes_view(strongbox::schema::key::kBalanceKeyPrefix));
  for (const auto& [key, value] : rows) {
    auto parsed = strongbox::schema::key::parse_balance_key(key);
    auto word = encoder.try_decode<hash32_t>(value);
    if (!parsed || !word) {
      strongbox::common::critical("corrupt ledger balance row");
    }
    ledger_.load_balance(parsed->first, parsed->second, make_amount(*word));
  }

  auto total_key = strongbox::schema::key::make_total_key();
  if (auto total = storage_.get<hash32_t>(encoder, total_key)) {
    ledger_.load_total(make_amount(*total));
  }
  spdlog::debug("Loaded {} balance row(s)", rows.size());
}

}  // namespace strongbox::execution
