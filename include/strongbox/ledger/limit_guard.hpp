#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <optional>

namespace strongbox::ledger {

/// Returns std::nullopt when `current_total + incoming_value <= cap`,
/// otherwise cap_exceeded. The sum is never materialized, so totals near the
/// top of the 256-bit range cannot overflow.
std::optional<strongbox::schema::vault_error_code> check_cap(
    const strongbox::schema::accounting_value_t& current_total,
    const strongbox::schema::accounting_value_t& incoming_value,
    const strongbox::schema::accounting_value_t& cap);

/// Returns std::nullopt when `value <= max_withdraw`, otherwise
/// limit_exceeded.
std::optional<strongbox::schema::vault_error_code> check_withdraw_limit(
    const strongbox::schema::accounting_value_t& value,
    const strongbox::schema::accounting_value_t& max_withdraw);

}  // namespace strongbox::ledger
