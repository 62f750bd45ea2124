#include <strongbox/ledger/limit_guard.hpp>

using namespace strongbox::schema;

namespace strongbox::ledger {

std::optional<vault_error_code> check_cap(
    const accounting_value_t& current_total,
    const accounting_value_t& incoming_value,
    const accounting_value_t& cap) {
  if (incoming_value > cap || current_total > cap - incoming_value) {
    return vault_error_code::cap_exceeded;
  }
  return std::nullopt;
}

std::optional<vault_error_code> check_withdraw_limit(
    const accounting_value_t& value,
    const accounting_value_t& max_withdraw) {
  if (value > max_withdraw) {
    return vault_error_code::limit_exceeded;
  }
  return std::nullopt;
}

}  // namespace strongbox::ledger
