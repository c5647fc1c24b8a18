#pragma once

#include <cstdint>

namespace rawinput {

// Legacy two-short rate encoding. Boundary constants are fixed by the
// collector and must not change.
constexpr double RATE_HZ_THRESHOLD   = 0.9999;
constexpr double RATE_MINUTE_EPSILON = 1e-8;
constexpr int16_t HZ_DIVISOR         = -100;
constexpr int16_t SUBHZ_DIVISOR      = -10000;
constexpr int16_t MINUTE_MANTISSA    = -60;
constexpr int16_t MINUTE_DIVISOR     = 1;

// Highest rate whose mantissa (rate * 100) still fits an int16
constexpr double MAX_ENCODABLE_RATE = 327.67;

struct RateCode {
    int16_t mantissa;
    int16_t divisor;
};

// First matching rule wins:
//   rate > 0.9999             -> (round(rate * 100), -100)
//   rate * 60 - 1.0 < 1e-8    -> (-60, 1)            one sample per minute
//   otherwise                 -> (round(rate * 10000), -10000)
RateCode encode_rate(double rate);

// SEED factor/multiplier semantics: a negative divisor divides, a positive
// one multiplies; a negative mantissa is a period in seconds.
double decode_rate(RateCode code);

// True for finite rates in (0, MAX_ENCODABLE_RATE]
bool rate_encodable(double rate);

} // namespace rawinput
