#pragma once

#include <strongbox/schema/oracle_reading.hpp>
#include <strongbox/schema/primitives.hpp>
#include <functional>

namespace strongbox::ledger {

/// Latest native-currency price. May throw; a throwing oracle is treated as
/// an invalid reading.
using price_oracle_t = std::function<strongbox::schema::oracle_reading_t()>;

/// Current wall-clock time in milliseconds since the epoch.
using time_source_t =
    std::function<strongbox::schema::timestamp_milliseconds_t()>;

time_source_t system_time_source();

/// Oracle that always answers with the same rate, stamped with the current
/// time of `clock`.
price_oracle_t make_fixed_rate_oracle(const strongbox::schema::rate_t& rate,
                                      uint8_t precision,
                                      time_source_t clock);

}  // namespace strongbox::ledger
