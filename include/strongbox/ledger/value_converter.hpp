#pragma once

#include <strongbox/ledger/price_oracle.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <cstdint>
#include <optional>

namespace strongbox::ledger {

/// Fractional digits of the accounting unit.
inline constexpr auto kAccountingDecimals = uint32_t{6};
/// Fixed precision of the native currency.
inline constexpr auto kNativeDecimals = uint32_t{18};
/// Assumed precision of every pegged (non-native) asset. Not queried per
/// asset.
inline constexpr auto kPeggedAssetDecimals = uint32_t{18};
/// Largest oracle precision for which 10^(kNativeDecimals + precision) still
/// fits in 256 bits.
inline constexpr auto kMaxRatePrecision = uint32_t{59};

struct conversion_result final {
  strongbox::schema::accounting_value_t value{};
  std::optional<strongbox::schema::vault_error_code> error;
};

/// Converts native asset amounts into accounting units.
///
/// The native currency is priced through the oracle:
///   value = amount * rate * 10^6 / 10^(18 + precision)
/// with the multiplication carried out first and the division truncating.
/// Every other asset is assumed pegged 1:1 and is only rescaled from
/// kPeggedAssetDecimals to kAccountingDecimals.
class value_converter final {
 public:
  /// `max_reading_age` of 0 disables the staleness check.
  explicit value_converter(
      price_oracle_t oracle,
      strongbox::schema::duration_milliseconds_t max_reading_age = 0,
      time_source_t clock = system_time_source());

  conversion_result value_of(const strongbox::schema::asset_id_t& asset,
                             const strongbox::schema::amount_t& amount) const;

  strongbox::schema::duration_milliseconds_t max_reading_age() const;

 private:
  conversion_result native_value_of(
      const strongbox::schema::amount_t& amount) const;
  conversion_result pegged_value_of(
      const strongbox::schema::amount_t& amount) const;

  /// Validity checks on an oracle answer. Returns false when the reading
  /// cannot be used.
  bool usable(const strongbox::schema::oracle_reading_t& reading) const;

  price_oracle_t oracle_;
  strongbox::schema::duration_milliseconds_t max_reading_age_{};
  time_source_t clock_;
};

/// 10^exponent in 256-bit checked arithmetic. Throws std::overflow_error when
/// the power does not fit.
strongbox::schema::amount_t pow10(uint32_t exponent);

}  // namespace strongbox::ledger
