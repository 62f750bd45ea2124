#pragma once
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace strongbox::schema::key {

struct builder final {
  strongbox::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
};

}  // namespace strongbox::schema::key
