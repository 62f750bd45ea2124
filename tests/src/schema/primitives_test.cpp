#include <gtest/gtest.h>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>

#include <limits>

TEST(primitives, try_make_hash32_decodes_hex) {
  auto hash = strongbox::schema::try_make_hash32(
      "0x0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(strongbox::schema::to_hex(*hash).substr(0, 4), "0102");
}

TEST(primitives, try_make_hash32_rejects_short_or_invalid_hex) {
  EXPECT_FALSE(strongbox::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(strongbox::schema::try_make_hash32(std::string(64, 'z'))
                   .has_value());
}

TEST(primitives, native_asset_is_the_zero_hash) {
  EXPECT_TRUE(strongbox::schema::is_native_asset(
      strongbox::schema::make_zero_hash()));
  auto token = strongbox::schema::make_zero_hash();
  token[31] = 1;
  EXPECT_FALSE(strongbox::schema::is_native_asset(token));
}

TEST(primitives, amount_words_are_big_endian) {
  auto word = strongbox::schema::make_word(strongbox::schema::amount_t{0x0102});
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  EXPECT_EQ(word[0], 0x00);
  EXPECT_EQ(strongbox::schema::make_amount(word),
            strongbox::schema::amount_t{0x0102});

  auto max = (std::numeric_limits<strongbox::schema::amount_t>::max)();
  auto max_word = strongbox::schema::make_word(max);
  for (auto byte : max_word) {
    EXPECT_EQ(byte, 0xFF);
  }
  EXPECT_EQ(strongbox::schema::make_amount(max_word), max);
}

TEST(primitives, try_make_amount_parses_unsigned_decimals) {
  auto parsed = strongbox::schema::try_make_amount("400000000000000000");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->str(), "400000000000000000");

  EXPECT_FALSE(strongbox::schema::try_make_amount("").has_value());
  EXPECT_FALSE(strongbox::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(strongbox::schema::try_make_amount("12a").has_value());
  // 2^256 does not fit.
  EXPECT_FALSE(strongbox::schema::try_make_amount(
                   "1157920892373161954235709850086879078532699846656405640394"
                   "57584007913129639936")
                   .has_value());
}

TEST(primitives, try_make_rate_accepts_negative_values) {
  auto rate = strongbox::schema::try_make_rate("-1");
  ASSERT_TRUE(rate.has_value());
  EXPECT_EQ(*rate, strongbox::schema::rate_t{-1});
  EXPECT_FALSE(strongbox::schema::try_make_rate("-").has_value());
  EXPECT_FALSE(strongbox::schema::try_make_rate("1.5").has_value());
}

TEST(primitives, vault_error_codes_map_to_names) {
  using strongbox::schema::vault_error_code;
  EXPECT_EQ(strongbox::schema::to_string(vault_error_code::cap_exceeded),
            "cap_exceeded");
  EXPECT_EQ(strongbox::schema::try_make_vault_error_code("insufficient_balance"),
            vault_error_code::insufficient_balance);
  EXPECT_FALSE(
      strongbox::schema::try_make_vault_error_code("nope").has_value());
  EXPECT_EQ(strongbox::schema::to_string(static_cast<vault_error_code>(42)),
            "unknown");
  EXPECT_EQ(strongbox::schema::to_code(vault_error_code::zero_amount), 1u);
}
