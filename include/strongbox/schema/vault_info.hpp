#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_limits.hpp>
#include <cstdint>
#include <string>

namespace strongbox::schema {

template <uint16_t Version>
struct vault_info;

template <>
struct vault_info<1> final {
  uint16_t version{1};
  std::string data{"strongbox-ledger"};
  uint64_t sequence{};
  hash32_t state_root{};
  accounting_value_t total_deposited_value{};
  vault_limits_t limits{};
};

using vault_info_t = vault_info<1>;

}  // namespace strongbox::schema
