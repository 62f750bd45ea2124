#pragma once
#include <strongbox/schema/primitives.hpp>
#include <string_view>

namespace strongbox::blake3 {

strongbox::schema::hash32_t hash(const std::string_view& str);
strongbox::schema::hash32_t hash(const strongbox::schema::bytes_view_t& bytes);

}  // namespace strongbox::blake3
