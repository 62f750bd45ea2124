#include <strongbox/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace strongbox::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bool all_digits(const std::string_view value) {
  return !value.empty() &&
         std::ranges::all_of(value, [](const char ch) {
           return std::isdigit(static_cast<unsigned char>(ch)) != 0;
         });
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

asset_id_t native_asset_id() {
  return make_zero_hash();
}

bool is_native_asset(const asset_id_t& asset) {
  return asset == native_asset_id();
}

hash32_t make_word(const amount_t& value) {
  auto bytes = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(bytes), 8);
  auto word = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes),
            std::end(word) - static_cast<std::ptrdiff_t>(bytes.size()));
  return word;
}

amount_t make_amount(const hash32_t& word) {
  auto value = amount_t{};
  boost::multiprecision::import_bits(value, std::begin(word), std::end(word),
                                     8);
  return value;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (!all_digits(decimal)) {
    return std::nullopt;
  }
  try {
    return amount_t{std::string{decimal}};
  } catch (const std::exception&) {
    // Wider than 256 bits.
    return std::nullopt;
  }
}

std::optional<rate_t> try_make_rate(const std::string_view decimal) {
  auto negative = decimal.starts_with('-');
  auto digits = negative ? decimal.substr(1) : decimal;
  if (!all_digits(digits)) {
    return std::nullopt;
  }
  try {
    auto magnitude = rate_t{std::string{digits}};
    return negative ? rate_t{-magnitude} : magnitude;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace strongbox::schema
