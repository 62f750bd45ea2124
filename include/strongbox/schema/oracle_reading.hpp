#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: oracle reading.
// Price feed answer for the native currency, expressed as `rate` units of
// account per native unit, scaled by 10^precision.
namespace strongbox::schema {

template <uint16_t Version>
struct oracle_reading;

template <>
struct oracle_reading<1> final {
  uint16_t version{1};
  rate_t rate{};
  uint8_t precision{};
  timestamp_milliseconds_t updated_at{};
};

using oracle_reading_t = oracle_reading<1>;

}  // namespace strongbox::schema
