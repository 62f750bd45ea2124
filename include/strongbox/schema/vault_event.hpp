#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: vault event.
// Emitted only after an operation is committed.
namespace strongbox::schema {

template <uint16_t Version>
struct deposit_completed;

template <>
struct deposit_completed<1> final {
  uint16_t version{1};
  account_id_t account;
  asset_id_t asset;
  amount_t amount{};
  accounting_value_t accounting_value{};
};

using deposit_completed_t = deposit_completed<1>;

template <uint16_t Version>
struct withdraw_completed;

template <>
struct withdraw_completed<1> final {
  uint16_t version{1};
  account_id_t account;
  asset_id_t asset;
  amount_t amount{};
};

using withdraw_completed_t = withdraw_completed<1>;

template <uint16_t Version>
struct balance_changed;

template <>
struct balance_changed<1> final {
  uint16_t version{1};
  account_id_t account;
  asset_id_t asset;
  amount_t new_balance{};
};

using balance_changed_t = balance_changed<1>;

using vault_event_t = std::variant<deposit_completed_t,
                                   withdraw_completed_t,
                                   balance_changed_t>;

}  // namespace strongbox::schema
