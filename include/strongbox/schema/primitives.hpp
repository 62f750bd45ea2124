#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strongbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using asset_id_t = hash32_t;
/// Balances and accounting values never wrap: checked arithmetic throws on
/// overflow and on unsigned underflow.
using amount_t = boost::multiprecision::checked_uint256_t;
using accounting_value_t = amount_t;
using rate_t = boost::multiprecision::checked_int256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);

/// The reserved identifier of the platform's native currency (all zero).
asset_id_t native_asset_id();
bool is_native_asset(const asset_id_t& asset);

/// Amounts are persisted and hashed as 32-byte big-endian words.
hash32_t make_word(const amount_t& value);
amount_t make_amount(const hash32_t& word);

/// Parse an unsigned decimal string; std::nullopt when malformed or wider
/// than 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view decimal);
/// Parse a signed decimal string (optional leading '-').
std::optional<rate_t> try_make_rate(const std::string_view decimal);

}  // namespace strongbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
