#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace strongbox::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  accounting_value_t value{};
  std::vector<vault_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace strongbox::schema
