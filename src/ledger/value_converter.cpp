#include <spdlog/spdlog.h>
#include <strongbox/ledger/value_converter.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

using namespace strongbox::schema;

namespace strongbox::ledger {

amount_t pow10(const uint32_t exponent) {
  auto result = amount_t{1};
  for (auto i = uint32_t{0}; i < exponent; ++i) {
    result *= 10u;
  }
  return result;
}

value_converter::value_converter(price_oracle_t oracle,
                                 const duration_milliseconds_t max_reading_age,
                                 time_source_t clock)
    : oracle_{std::move(oracle)},
      max_reading_age_{max_reading_age},
      clock_{std::move(clock)} {}

conversion_result value_converter::value_of(const asset_id_t& asset,
                                            const amount_t& amount) const {
  if (amount == 0) {
    return conversion_result{};
  }
  if (is_native_asset(asset)) {
    return native_value_of(amount);
  }
  return pegged_value_of(amount);
}

duration_milliseconds_t value_converter::max_reading_age() const {
  return max_reading_age_;
}

conversion_result value_converter::native_value_of(
    const amount_t& amount) const {
  auto invalid = conversion_result{
      .value = {}, .error = vault_error_code::invalid_oracle_reading};
  if (!oracle_) {
    spdlog::warn("No price oracle installed for native conversion");
    return invalid;
  }

  auto reading = oracle_reading_t{};
  try {
    reading = oracle_();
  } catch (const std::exception& ex) {
    spdlog::warn("Price oracle failed: {}", ex.what());
    return invalid;
  }
  if (!usable(reading)) {
    return invalid;
  }

  try {
    auto numerator = amount_t{amount * static_cast<amount_t>(reading.rate) *
                              pow10(kAccountingDecimals)};
    return conversion_result{
        .value = numerator / pow10(kNativeDecimals + reading.precision),
        .error = std::nullopt};
  } catch (const std::overflow_error&) {
    spdlog::warn("Native conversion of {} overflows 256 bits", amount.str());
    return conversion_result{.value = {},
                             .error = vault_error_code::arithmetic_overflow};
  }
}

conversion_result value_converter::pegged_value_of(
    const amount_t& amount) const {
  static_assert(kPeggedAssetDecimals >= kAccountingDecimals,
                "pegged assets are rescaled down to accounting precision");
  return conversion_result{
      .value = amount / pow10(kPeggedAssetDecimals - kAccountingDecimals),
      .error = std::nullopt};
}

bool value_converter::usable(const oracle_reading_t& reading) const {
  if (reading.rate <= 0) {
    spdlog::warn("Rejecting non-positive oracle rate {}", reading.rate.str());
    return false;
  }
  if (reading.precision > kMaxRatePrecision) {
    spdlog::warn("Rejecting oracle precision {}", reading.precision);
    return false;
  }
  if (reading.updated_at == 0) {
    spdlog::warn("Rejecting oracle reading that was never updated");
    return false;
  }
  if (max_reading_age_ == 0) {
    return true;
  }
  auto now = clock_();
  if (reading.updated_at > now) {
    spdlog::warn("Rejecting oracle reading stamped in the future ({} > {})",
                 reading.updated_at, now);
    return false;
  }
  if (now - reading.updated_at > max_reading_age_) {
    spdlog::warn("Rejecting stale oracle reading: age {}ms exceeds {}ms",
                 now - reading.updated_at, max_reading_age_);
    return false;
  }
  return true;
}

}  // namespace strongbox::ledger
