#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace strongbox::schema {

/// Rejection reasons reported in operation results. A result code of 0 means
/// success; every other code is one of these values.
enum class vault_error_code : uint32_t {
  zero_amount = 1,
  cap_exceeded = 2,
  limit_exceeded = 3,
  insufficient_balance = 4,
  invalid_oracle_reading = 5,
  transfer_failed = 6,
  wrong_deposit_path = 7,
  arithmetic_overflow = 8,
  reentrant_call = 9,
};

inline constexpr auto kVaultErrorCodeMappings = std::array{
    std::pair<std::string_view, vault_error_code>{
        "zero_amount", vault_error_code::zero_amount},
    std::pair<std::string_view, vault_error_code>{
        "cap_exceeded", vault_error_code::cap_exceeded},
    std::pair<std::string_view, vault_error_code>{
        "limit_exceeded", vault_error_code::limit_exceeded},
    std::pair<std::string_view, vault_error_code>{
        "insufficient_balance", vault_error_code::insufficient_balance},
    std::pair<std::string_view, vault_error_code>{
        "invalid_oracle_reading", vault_error_code::invalid_oracle_reading},
    std::pair<std::string_view, vault_error_code>{
        "transfer_failed", vault_error_code::transfer_failed},
    std::pair<std::string_view, vault_error_code>{
        "wrong_deposit_path", vault_error_code::wrong_deposit_path},
    std::pair<std::string_view, vault_error_code>{
        "arithmetic_overflow", vault_error_code::arithmetic_overflow},
    std::pair<std::string_view, vault_error_code>{
        "reentrant_call", vault_error_code::reentrant_call},
};

/// Name of `value` as it appears in result logs, "unknown" for values outside
/// the enumeration.
inline constexpr std::string_view to_string(const vault_error_code value) {
  for (const auto& [name, code] : kVaultErrorCodeMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

inline constexpr std::optional<vault_error_code> try_make_vault_error_code(
    const std::string_view name) {
  for (const auto& [candidate, code] : kVaultErrorCodeMappings) {
    if (candidate == name) {
      return code;
    }
  }
  return std::nullopt;
}

/// Numeric result code; 0 is reserved for success.
inline constexpr uint32_t to_code(const vault_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace strongbox::schema
