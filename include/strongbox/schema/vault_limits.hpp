#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

namespace strongbox::schema {

template <uint16_t Version>
struct vault_limits;

/// Both limits are in accounting units (6 fractional digits) and are fixed
/// for the lifetime of a vault.
template <>
struct vault_limits<1> final {
  uint16_t version{1};
  accounting_value_t max_total_value{};
  accounting_value_t max_withdraw_value{};
};

using vault_limits_t = vault_limits<1>;

}  // namespace strongbox::schema
