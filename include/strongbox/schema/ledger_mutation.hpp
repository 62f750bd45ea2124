#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: ledger mutation.
// The alternative decides the sign: a deposit credits the balance and the
// running total, a withdrawal debits both.
namespace strongbox::schema {

template <uint16_t Version>
struct deposit_mutation;

template <>
struct deposit_mutation<1> final {
  uint16_t version{1};
  account_id_t account;
  asset_id_t asset;
  amount_t amount{};
  accounting_value_t value{};
};

using deposit_mutation_t = deposit_mutation<1>;

template <uint16_t Version>
struct withdraw_mutation;

template <>
struct withdraw_mutation<1> final {
  uint16_t version{1};
  account_id_t account;
  asset_id_t asset;
  amount_t amount{};
  accounting_value_t value{};
};

using withdraw_mutation_t = withdraw_mutation<1>;

using ledger_mutation_t = std::variant<deposit_mutation_t, withdraw_mutation_t>;

}  // namespace strongbox::schema
