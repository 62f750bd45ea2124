#pragma once

#include <strongbox/schema/primitives.hpp>
#include <functional>

namespace strongbox::ledger {

/// Moves `amount` of `asset` for `account`. Returns false when the transfer
/// did not happen.
using transfer_function_t =
    std::function<bool(const strongbox::schema::account_id_t& account,
                       const strongbox::schema::asset_id_t& asset,
                       const strongbox::schema::amount_t& amount)>;

struct transfer_gateway_t final {
  /// Pulls a pre-authorized non-native deposit into custody.
  transfer_function_t pull;
  /// Pushes a withdrawal (native or not) out to the account.
  transfer_function_t push;
};

}  // namespace strongbox::ledger
