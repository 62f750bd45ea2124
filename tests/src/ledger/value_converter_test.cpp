#include <gtest/gtest.h>
#include <strongbox/ledger/value_converter.hpp>
#include <strongbox/testing/common.hpp>

#include <limits>
#include <stdexcept>

namespace {

using strongbox::schema::accounting_value_t;
using strongbox::schema::amount_t;
using strongbox::schema::oracle_reading_t;
using strongbox::schema::rate_t;
using strongbox::schema::vault_error_code;

constexpr auto kNow = strongbox::schema::timestamp_milliseconds_t{1'000'000};

struct scripted_oracle final {
  oracle_reading_t reading{.version = 1,
                           .rate = rate_t{"200000000000"},
                           .precision = 8,
                           .updated_at = kNow};
  int calls{};

  strongbox::ledger::price_oracle_t handle() {
    return [this] {
      ++calls;
      return reading;
    };
  }
};

strongbox::ledger::value_converter make_converter(
    scripted_oracle& oracle,
    const strongbox::schema::duration_milliseconds_t max_age = 0) {
  return strongbox::ledger::value_converter{oracle.handle(), max_age,
                                            [] { return kNow; }};
}

strongbox::schema::asset_id_t token() {
  return strongbox::testing::make_hash(7);
}

}  // namespace

TEST(value_converter, native_amount_uses_oracle_rate) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle);
  auto native = strongbox::schema::native_asset_id();

  auto result =
      converter.value_of(native, strongbox::testing::native_units(0, 4));
  ASSERT_FALSE(result.error.has_value());
  EXPECT_EQ(result.value, accounting_value_t{800'000'000});

  result = converter.value_of(native, strongbox::testing::native_units(1));
  ASSERT_FALSE(result.error.has_value());
  EXPECT_EQ(result.value, accounting_value_t{2'000'000'000});
  EXPECT_EQ(oracle.calls, 2);
}

TEST(value_converter, native_conversion_truncates_below_accounting_precision) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle);
  // 1 wei at 2000 units per native unit is 2e-15 units.
  auto result =
      converter.value_of(strongbox::schema::native_asset_id(), amount_t{1});
  ASSERT_FALSE(result.error.has_value());
  EXPECT_EQ(result.value, accounting_value_t{0});

  // 10^9 wei is worth 2 * 10^-6 units.
  result = converter.value_of(strongbox::schema::native_asset_id(),
                              amount_t{1'000'000'000});
  EXPECT_EQ(result.value, accounting_value_t{2});
}

TEST(value_converter, zero_amount_never_consults_oracle) {
  auto oracle = scripted_oracle{};
  oracle.reading.rate = rate_t{-1};
  auto converter = make_converter(oracle);

  auto result =
      converter.value_of(strongbox::schema::native_asset_id(), amount_t{0});
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.value, accounting_value_t{0});
  EXPECT_EQ(oracle.calls, 0);
}

TEST(value_converter, non_positive_rate_is_invalid) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle);
  auto amount = strongbox::testing::native_units(1);

  oracle.reading.rate = rate_t{-1};
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), amount)
                .error,
            vault_error_code::invalid_oracle_reading);

  oracle.reading.rate = rate_t{0};
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), amount)
                .error,
            vault_error_code::invalid_oracle_reading);
}

TEST(value_converter, incomplete_or_imprecise_readings_are_invalid) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle);
  auto amount = strongbox::testing::native_units(1);

  oracle.reading.updated_at = 0;
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), amount)
                .error,
            vault_error_code::invalid_oracle_reading);

  oracle.reading.updated_at = kNow;
  oracle.reading.precision =
      static_cast<uint8_t>(strongbox::ledger::kMaxRatePrecision + 1);
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), amount)
                .error,
            vault_error_code::invalid_oracle_reading);

  oracle.reading.precision =
      static_cast<uint8_t>(strongbox::ledger::kMaxRatePrecision);
  EXPECT_FALSE(converter.value_of(strongbox::schema::native_asset_id(), amount)
                   .error.has_value());
}

TEST(value_converter, stale_readings_are_rejected_when_bounded) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle, 60'000);
  auto amount = strongbox::testing::native_units(1);

  oracle.reading.updated_at = kNow - 60'000;
  EXPECT_FALSE(converter.value_of(strongbox::schema::native_asset_id(), amount)
                   .error.has_value());

  oracle.reading.updated_at = kNow - 60'001;
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), amount)
                .error,
            vault_error_code::invalid_oracle_reading);

  oracle.reading.updated_at = kNow + 1;
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), amount)
                .error,
            vault_error_code::invalid_oracle_reading);
}

TEST(value_converter, unbounded_age_accepts_old_readings) {
  auto oracle = scripted_oracle{};
  oracle.reading.updated_at = 1;
  auto converter = make_converter(oracle);
  EXPECT_FALSE(converter
                   .value_of(strongbox::schema::native_asset_id(),
                             strongbox::testing::native_units(1))
                   .error.has_value());
}

TEST(value_converter, throwing_or_missing_oracle_is_invalid) {
  auto throwing = strongbox::ledger::value_converter{
      []() -> oracle_reading_t { throw std::runtime_error{"feed offline"}; }};
  EXPECT_EQ(throwing
                .value_of(strongbox::schema::native_asset_id(),
                          strongbox::testing::native_units(1))
                .error,
            vault_error_code::invalid_oracle_reading);

  auto missing = strongbox::ledger::value_converter{nullptr};
  EXPECT_EQ(missing
                .value_of(strongbox::schema::native_asset_id(),
                          strongbox::testing::native_units(1))
                .error,
            vault_error_code::invalid_oracle_reading);
}

TEST(value_converter, native_overflow_aborts_instead_of_wrapping) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle);
  auto huge = (std::numeric_limits<amount_t>::max)();
  EXPECT_EQ(converter.value_of(strongbox::schema::native_asset_id(), huge)
                .error,
            vault_error_code::arithmetic_overflow);
}

TEST(value_converter, pegged_assets_rescale_without_oracle) {
  auto oracle = scripted_oracle{};
  oracle.reading.rate = rate_t{-1};
  auto converter = make_converter(oracle);

  auto result = converter.value_of(token(), amount_t{"1000000000000000000"});
  ASSERT_FALSE(result.error.has_value());
  EXPECT_EQ(result.value, accounting_value_t{1'000'000});

  result = converter.value_of(token(), amount_t{1'000'000'000'000});
  EXPECT_EQ(result.value, accounting_value_t{1});

  result = converter.value_of(token(), amount_t{999'999'999'999});
  EXPECT_EQ(result.value, accounting_value_t{0});
  EXPECT_EQ(oracle.calls, 0);
}

TEST(value_converter, pegged_rescale_only_divides) {
  auto oracle = scripted_oracle{};
  auto converter = make_converter(oracle);
  auto huge = (std::numeric_limits<amount_t>::max)();

  auto result = converter.value_of(token(), huge);
  ASSERT_FALSE(result.error.has_value());
  EXPECT_EQ(result.value, amount_t{huge / strongbox::ledger::pow10(12)});
  EXPECT_LT(result.value, huge);
}

TEST(value_converter, pow10_matches_decimal_powers) {
  EXPECT_EQ(strongbox::ledger::pow10(0), amount_t{1});
  EXPECT_EQ(strongbox::ledger::pow10(6), amount_t{1'000'000});
  EXPECT_EQ(strongbox::ledger::pow10(18), amount_t{"1000000000000000000"});
  EXPECT_THROW(strongbox::ledger::pow10(78), std::overflow_error);
}
