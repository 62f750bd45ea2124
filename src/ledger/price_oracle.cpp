#include <strongbox/ledger/price_oracle.hpp>

#include <chrono>
#include <utility>

namespace strongbox::ledger {

time_source_t system_time_source() {
  return [] {
    return static_cast<strongbox::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

price_oracle_t make_fixed_rate_oracle(const strongbox::schema::rate_t& rate,
                                      const uint8_t precision,
                                      time_source_t clock) {
  return [rate, precision, clock = std::move(clock)] {
    return strongbox::schema::oracle_reading_t{
        .rate = rate, .precision = precision, .updated_at = clock()};
  };
}

}  // namespace strongbox::ledger
