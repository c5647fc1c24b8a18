#include "rawinput/rate_codec.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace rawinput;

TEST(RateCodec, HertzRatesUseHundredthsDivisor) {
    const double rates[] = {1.0, 1.234, 20.0, 40.0, 99.999, 100.0, 200.0, 250.0, 327.67};
    for (double r : rates) {
        RateCode c = encode_rate(r);
        EXPECT_EQ(c.divisor, -100) << r;
        EXPECT_EQ(c.mantissa, static_cast<int16_t>(std::lround(r * 100))) << r;
        EXPECT_DOUBLE_EQ(decode_rate(c), std::round(r * 100) / 100.0) << r;
    }
}

TEST(RateCodec, OneHertzIsHundredOverMinusHundred) {
    RateCode c = encode_rate(1.0);
    EXPECT_EQ(c.mantissa, 100);
    EXPECT_EQ(c.divisor, -100);
}

TEST(RateCodec, OneSamplePerMinute) {
    RateCode c = encode_rate(1.0 / 60.0);
    EXPECT_EQ(c.mantissa, -60);
    EXPECT_EQ(c.divisor, 1);
    EXPECT_DOUBLE_EQ(decode_rate(c), 1.0 / 60.0);

    c = encode_rate(1.0 / 60.0 + 1e-10);
    EXPECT_EQ(c.mantissa, -60);
    EXPECT_EQ(c.divisor, 1);
}

TEST(RateCodec, SubHertzRatesKeepFourDigits) {
    const double rates[] = {0.0175, 0.1, 0.1234, 0.25, 0.5, 0.9, 0.9999};
    for (double r : rates) {
        RateCode c = encode_rate(r);
        EXPECT_EQ(c.divisor, -10000) << r;
        EXPECT_EQ(c.mantissa, static_cast<int16_t>(std::lround(r * 10000))) << r;
        EXPECT_NEAR(decode_rate(c), r, 0.5e-4) << r;
    }
}

TEST(RateCodec, ThresholdIsExclusive) {
    EXPECT_EQ(encode_rate(0.9999).divisor, -10000);
    EXPECT_EQ(encode_rate(0.99991).divisor, -100);
}

// rate * 60 - 1 < 1e-8 also holds below 1/60; the collector expects the
// minute code for those too.
TEST(RateCodec, SlowerThanOnePerMinuteTakesMinuteCode) {
    RateCode c = encode_rate(0.01);
    EXPECT_EQ(c.mantissa, -60);
    EXPECT_EQ(c.divisor, 1);
}

TEST(RateCodec, DecodeSeedSignConventions) {
    EXPECT_DOUBLE_EQ(decode_rate(RateCode{20, 5}), 100.0);
    EXPECT_DOUBLE_EQ(decode_rate(RateCode{4000, -100}), 40.0);
    EXPECT_DOUBLE_EQ(decode_rate(RateCode{-10, 1}), 0.1);
    EXPECT_DOUBLE_EQ(decode_rate(RateCode{-10, -10}), 0.01);
    EXPECT_DOUBLE_EQ(decode_rate(RateCode{0, 0}), 0.0);
}

TEST(RateCodec, Encodable) {
    EXPECT_TRUE(rate_encodable(0.001));
    EXPECT_TRUE(rate_encodable(100.0));
    EXPECT_TRUE(rate_encodable(327.67));
    EXPECT_FALSE(rate_encodable(327.68));
    EXPECT_FALSE(rate_encodable(1000.0));
    EXPECT_FALSE(rate_encodable(0.0));
    EXPECT_FALSE(rate_encodable(-1.0));
    EXPECT_FALSE(rate_encodable(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(rate_encodable(std::numeric_limits<double>::infinity()));
}

TEST(RateCodec, EncodableRatesNeverWrapMantissa) {
    const double rates[] = {0.5, 0.9999, 1.0, 150.0, 327.0, 327.66, 327.67};
    for (double r : rates) {
        ASSERT_TRUE(rate_encodable(r)) << r;
        RateCode c = encode_rate(r);
        EXPECT_GT(c.mantissa, 0) << r;
        EXPECT_NEAR(decode_rate(c), r, 0.0001) << r;
    }
    // First rate past the limit would need mantissa 32768
    EXPECT_FALSE(rate_encodable(327.675));
}
