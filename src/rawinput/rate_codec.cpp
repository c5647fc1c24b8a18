#include "rawinput/rate_codec.hpp"

#include <cmath>

namespace rawinput {

RateCode encode_rate(double rate) {
    RateCode code;
    if (rate > RATE_HZ_THRESHOLD) {
        code.mantissa = static_cast<int16_t>(std::lround(rate * 100.0));
        code.divisor = HZ_DIVISOR;
    } else if (rate * 60.0 - 1.0 < RATE_MINUTE_EPSILON) {
        code.mantissa = MINUTE_MANTISSA;
        code.divisor = MINUTE_DIVISOR;
    } else {
        code.mantissa = static_cast<int16_t>(std::lround(rate * 10000.0));
        code.divisor = SUBHZ_DIVISOR;
    }
    return code;
}

double decode_rate(RateCode code) {
    double f = code.mantissa;
    double m = code.divisor;
    if (f == 0.0 || m == 0.0) return 0.0;

    if (f > 0 && m > 0) return f * m;
    if (f > 0 && m < 0) return -f / m;
    if (f < 0 && m > 0) return -m / f;
    return 1.0 / (f * m);
}

bool rate_encodable(double rate) {
    return std::isfinite(rate) && rate > 0.0 && rate <= MAX_ENCODABLE_RATE;
}

} // namespace rawinput
