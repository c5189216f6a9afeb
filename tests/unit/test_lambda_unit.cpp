/**
 * @file test_lambda_unit.cpp
 * @brief Unit tests for LambdaUnit (offset and logarithmic units)
 */

#include <gtest/gtest.h>
#include "LambdaUnit.hpp"
#include "Errors.hpp"
#include <cmath>

using namespace PQS;

class LambdaUnitTest : public ::testing::Test {
protected:
    void SetUp() override {
        temperature = ExponentVector::single("Theta");

        ExponentVector dim = temperature;
        celsius = LambdaUnit(
            [dim](double n) { return Quantity(n + 273.15, dim); },
            [](const Quantity& q) { return q.value() - 273.15; },
            temperature, "degC", true);

        decibel = LambdaUnit(
            [](double n) { return Quantity(std::pow(10.0, n / 10.0)); },
            [](const Quantity& q) { return 10.0 * std::log10(q.toNumber()); },
            ExponentVector(), "dB", false);
    }

    ExponentVector temperature;
    LambdaUnit celsius;
    LambdaUnit decibel;
};

TEST_F(LambdaUnitTest, ForwardSetsDisplay) {
    Quantity q = celsius.toQuantity(25.0);
    EXPECT_DOUBLE_EQ(q.value(), 298.15);
    EXPECT_EQ(q.dimension(), temperature);
    EXPECT_EQ(q.displayUnit(), ExponentVector::single("degC"));
}

TEST_F(LambdaUnitTest, RoundTrip) {
    for (double n : {-40.0, 0.0, 37.0, 100.0}) {
        EXPECT_NEAR(celsius.toNumber(celsius.toQuantity(n)), n, 1e-12);
    }
    for (double n : {-3.0, 0.0, 20.0}) {
        EXPECT_NEAR(decibel.toNumber(decibel.toQuantity(n)), n, 1e-12);
    }
}

TEST_F(LambdaUnitTest, InverseChecksDimension) {
    EXPECT_THROW(celsius.toNumber(Quantity(1.0, ExponentVector::single("L"))),
                 IncompatibleUnitError);
}

TEST_F(LambdaUnitTest, ForwardChecksDimension) {
    LambdaUnit broken(
        [](double n) { return Quantity(n); },
        [](const Quantity& q) { return q.value(); },
        temperature, "broken");
    EXPECT_THROW(broken.toQuantity(1.0), DimensionError);
}

TEST_F(LambdaUnitTest, RequiresBothFunctions) {
    EXPECT_THROW(LambdaUnit(nullptr, [](const Quantity& q) { return q.value(); }, temperature),
                 UnitError);
}

TEST_F(LambdaUnitTest, PowerOneIsIdentity) {
    LambdaUnit same = celsius.power(1);
    EXPECT_EQ(same.symbol(), "degC");
    EXPECT_DOUBLE_EQ(same.toQuantity(0.0).value(), 273.15);
}

TEST_F(LambdaUnitTest, ReciprocalOfDimensionless) {
    LambdaUnit inv = decibel.power(-1);
    // Forward of the reciprocal is the inverse of the original
    EXPECT_NEAR(inv.toQuantity(100.0).value(), 20.0, 1e-12);
    EXPECT_NEAR(inv.toNumber(Quantity(20.0)), 100.0, 1e-9);
}

TEST_F(LambdaUnitTest, OtherPowersThrow) {
    EXPECT_THROW(celsius.power(2), UnitError);
    EXPECT_THROW(celsius.power(-1), UnitError);
    EXPECT_THROW(decibel.power(Rational(1, 2)), UnitError);
}

TEST_F(LambdaUnitTest, ScaledAppliesPrefixFactor) {
    LambdaUnit milli = celsius.scaled(1e-3, "mdegC");
    EXPECT_EQ(milli.symbol(), "mdegC");
    EXPECT_FALSE(milli.prefixable());
    EXPECT_NEAR(milli.toQuantity(1000.0).value(), 274.15, 1e-12);
    EXPECT_NEAR(milli.toNumber(Quantity(274.15, temperature)), 1000.0, 1e-9);
}

TEST_F(LambdaUnitTest, Renamed) {
    LambdaUnit r = decibel.renamed("dBr", true);
    EXPECT_EQ(r.symbol(), "dBr");
    EXPECT_TRUE(r.prefixable());
    EXPECT_EQ(r.displayUnit(), ExponentVector::single("dBr"));
}
