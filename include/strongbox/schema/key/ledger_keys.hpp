#pragma once

#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: ledger keys.
// Canonical key layout of the persisted ledger rows. Balance keys are the
// prefix followed by the raw 32-byte account and asset ids.
namespace strongbox::schema::key {

inline constexpr std::string_view kLedgerPrefix{"LEDGER|"};
inline constexpr std::string_view kBalanceKeyPrefix{"LEDGER|BAL|"};
inline constexpr std::string_view kTotalKey{"LEDGER|TOTAL"};

strongbox::schema::bytes_t make_balance_key(
    const strongbox::schema::account_id_t& account,
    const strongbox::schema::asset_id_t& asset);

std::optional<
    std::pair<strongbox::schema::account_id_t, strongbox::schema::asset_id_t>>
parse_balance_key(const strongbox::schema::bytes_view_t& key);

strongbox::schema::bytes_t make_total_key();

}  // namespace strongbox::schema::key
