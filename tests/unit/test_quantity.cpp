/**
 * @file test_quantity.cpp
 * @brief Unit tests for Quantity, Unit and Constant
 */

#include <gtest/gtest.h>
#include "Quantity.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>

using namespace PQS;

class QuantityTest : public ::testing::Test {
protected:
    void SetUp() override {
        length = ExponentVector::single("L");
        time = ExponentVector::single("T");
    }

    ExponentVector length;
    ExponentVector time;
};

TEST_F(QuantityTest, DefaultIsDimensionlessZero) {
    Quantity q;
    EXPECT_DOUBLE_EQ(q.value(), 0.0);
    EXPECT_TRUE(q.isDimensionless());
    EXPECT_TRUE(q.displayUnit().empty());
}

TEST_F(QuantityTest, AddSameDimension) {
    Quantity a(2.0, length, ExponentVector::single("m"));
    Quantity b(3.0, length, ExponentVector::single("ft"));
    Quantity sum = a + b;
    EXPECT_DOUBLE_EQ(sum.value(), 5.0);
    EXPECT_EQ(sum.dimension(), length);
    // Left operand's display unit survives
    EXPECT_EQ(sum.displayUnit(), ExponentVector::single("m"));
}

TEST_F(QuantityTest, SubtractUndoesAdd) {
    Quantity a(2.5, length, ExponentVector::single("m"));
    Quantity b(0.75, length, ExponentVector::single("ft"));
    Quantity back = (a + b) - b;
    EXPECT_DOUBLE_EQ(back.value(), a.value());
    EXPECT_EQ(back.dimension(), a.dimension());
    EXPECT_EQ((a - b).dimension(), length);
    EXPECT_DOUBLE_EQ((a - a).value(), 0.0);
    EXPECT_EQ((a - a).dimension(), length);
}

TEST_F(QuantityTest, AddDifferentDimensionThrows) {
    EXPECT_THROW(Quantity(1.0, length) + Quantity(1.0, time), DimensionError);
    EXPECT_THROW(Quantity(1.0, length) - Quantity(1.0), DimensionError);
}

TEST_F(QuantityTest, MultiplyAndDivide) {
    Quantity d(10.0, length, ExponentVector::single("m"));
    Quantity t(2.0, time, ExponentVector::single("s"));

    Quantity v = d / t;
    EXPECT_DOUBLE_EQ(v.value(), 5.0);
    EXPECT_EQ(v.dimension(), (ExponentVector{{"L", 1}, {"T", -1}}));
    EXPECT_EQ(v.displayUnit(), (ExponentVector{{"m", 1}, {"s", -1}}));

    EXPECT_DOUBLE_EQ((v * t).value(), 10.0);
    EXPECT_DOUBLE_EQ((3.0 * d).value(), 30.0);
    EXPECT_EQ((1.0 / t).dimension(), time.inverse());
}

TEST_F(QuantityTest, DimensionsCancel) {
    Quantity a(4.0, length);
    Quantity b(2.0, length);
    EXPECT_TRUE((a / b).isDimensionless());
    EXPECT_DOUBLE_EQ((a / b).toNumber(), 2.0);
}

TEST_F(QuantityTest, ToNumberRequiresDimensionless) {
    EXPECT_THROW(Quantity(1.0, length).toNumber(), DimensionError);
    EXPECT_DOUBLE_EQ(Quantity(7.0).toNumber(), 7.0);
}

TEST_F(QuantityTest, PowerOfPower) {
    Quantity a(3.0, length, ExponentVector::single("m"));
    Rational p(3, 2);
    Rational q(4, 3);
    Quantity lhs = a.power(p).power(q);
    Quantity rhs = a.power(p * q);
    EXPECT_EQ(lhs.dimension(), rhs.dimension());
    EXPECT_EQ(lhs.displayUnit(), rhs.displayUnit());
    EXPECT_NEAR(lhs.value(), rhs.value(), 1e-12);
    EXPECT_EQ(rhs.dimension(), length.power(2));
}

TEST_F(QuantityTest, FractionalPowerOfNegativeThrows) {
    Quantity a(-4.0, length);
    EXPECT_THROW(a.power(Rational(1, 2)), FractionalPowerOfNegativeError);
    EXPECT_DOUBLE_EQ(a.power(2).value(), 16.0);
}

TEST_F(QuantityTest, NegateAndAbs) {
    Quantity a(-2.5, length);
    EXPECT_DOUBLE_EQ((-a).value(), 2.5);
    EXPECT_DOUBLE_EQ(a.abs().value(), 2.5);
    EXPECT_EQ(a.abs().dimension(), length);
}

TEST_F(QuantityTest, Comparison) {
    Quantity a(1.0, length, ExponentVector::single("m"));
    Quantity b(1.0, length, ExponentVector::single("km"));
    Quantity c(2.0, length);
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a.equals(b));
    EXPECT_TRUE(a < c);
    EXPECT_TRUE(c >= b);
    EXPECT_THROW((void)(a < Quantity(1.0, time)), DimensionError);
}

TEST_F(QuantityTest, ConvertTo) {
    Quantity km(1000.0, length, ExponentVector::single("km"));
    Quantity distance(2500.0, length);
    EXPECT_DOUBLE_EQ(distance.convertTo(km), 2.5);
    EXPECT_THROW(distance.convertTo(Quantity(1.0, time)), IncompatibleUnitError);
}

TEST_F(QuantityTest, WithDisplayUnitKeepsValue) {
    Quantity a(5.0, length);
    Quantity b = a.withDisplayUnit(ExponentVector::single("m"));
    EXPECT_DOUBLE_EQ(b.value(), 5.0);
    EXPECT_EQ(b.dimension(), length);
    EXPECT_EQ(b.displayUnit(), ExponentVector::single("m"));
}

TEST_F(QuantityTest, StreamOutput) {
    std::stringstream ss;
    ss << Quantity(1.5, length, ExponentVector::single("m"));
    EXPECT_EQ(ss.str(), "1.5 [L] (m)");
}

TEST_F(QuantityTest, UnitDisplaysItsSymbol) {
    Unit m("m", Quantity(1.0, length), true);
    EXPECT_EQ(m.symbol(), "m");
    EXPECT_TRUE(m.prefixable());
    EXPECT_EQ(m.displayUnit(), ExponentVector::single("m"));

    Quantity two_m = m * 2.0;
    EXPECT_DOUBLE_EQ(two_m.value(), 2.0);
    EXPECT_EQ(two_m.displayUnit(), ExponentVector::single("m"));
}

TEST_F(QuantityTest, ConstantKeepsDisplay) {
    Quantity speed(299792458.0, (ExponentVector{{"L", 1}, {"T", -1}}));
    Constant c("c", speed);
    EXPECT_EQ(c.symbol(), "c");
    EXPECT_DOUBLE_EQ(c.value(), 299792458.0);
    EXPECT_TRUE(c.displayUnit().empty());
}
