/**
 * @file test_formatter.cpp
 * @brief Unit tests for number and unit formatting in the text styles
 */

#include <gtest/gtest.h>
#include "Formatter.hpp"
#include "Errors.hpp"
#include <string>

using namespace PQS;

class FormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        energy = ExponentVector::fromString("kg*m2/s2");
        velocity = ExponentVector::fromString("m/s");
    }

    Formatter formatter;
    ExponentVector energy;
    ExponentVector velocity;
};

// ============================================================================
// Styles
// ============================================================================

TEST_F(FormatterTest, ParseStyle) {
    EXPECT_EQ(Formatter::parseStyle(""), FormatStyle::PLAIN);
    EXPECT_EQ(Formatter::parseStyle("H"), FormatStyle::HTML);
    EXPECT_EQ(Formatter::parseStyle("latex"), FormatStyle::LATEX);
    EXPECT_EQ(Formatter::parseStyle("U"), FormatStyle::UNICODE);
    EXPECT_EQ(Formatter::parseStyle("m"), FormatStyle::MODELICA);
    EXPECT_EQ(Formatter::parseStyle("Verbose"), FormatStyle::VERBOSE);
    EXPECT_THROW(Formatter::parseStyle("Q"), ParseError);
}

TEST_F(FormatterTest, StyleNames) {
    EXPECT_EQ(Formatter::styleToken(FormatStyle::LATEX), "L");
    EXPECT_EQ(Formatter::styleToken(FormatStyle::PLAIN), "");
    EXPECT_EQ(Formatter::styleName(FormatStyle::UNICODE), "unicode");
    EXPECT_EQ(Formatter::parseStyle(Formatter::styleName(FormatStyle::MODELICA)),
              FormatStyle::MODELICA);
}

// ============================================================================
// Units
// ============================================================================

TEST_F(FormatterTest, UnitInEachStyle) {
    EXPECT_EQ(formatter.formatUnit(energy, FormatStyle::PLAIN), "m2*kg/s2");
    EXPECT_EQ(formatter.formatUnit(energy, FormatStyle::HTML),
              "m<sup>2</sup>&nbsp;kg&nbsp;s<sup>-2</sup>");
    EXPECT_EQ(formatter.formatUnit(energy, FormatStyle::LATEX),
              "\\mathrm{m}^2\\,\\mathrm{kg}\\,\\mathrm{s}^{-2}");
    EXPECT_EQ(formatter.formatUnit(energy, FormatStyle::UNICODE), "m² kg s⁻²");
    EXPECT_EQ(formatter.formatUnit(energy, FormatStyle::MODELICA), "m2.kg/s2");
    EXPECT_EQ(formatter.formatUnit(energy, FormatStyle::VERBOSE), "m**2 * kg / s**2");
}

TEST_F(FormatterTest, Denominators) {
    EXPECT_EQ(formatter.formatUnit(velocity, FormatStyle::PLAIN), "m/s");
    EXPECT_EQ(formatter.formatUnit(ExponentVector::single("s", -1), FormatStyle::PLAIN), "1/s");
    EXPECT_EQ(formatter.formatUnit(ExponentVector::fromString("W/(m2*K)"), FormatStyle::PLAIN),
              "W/(m2*K)");
}

TEST_F(FormatterTest, RationalExponents) {
    ExponentVector root = ExponentVector::single("Hz", Rational(-1, 2));
    EXPECT_EQ(formatter.formatUnit(root, FormatStyle::PLAIN), "1/Hz(1/2)");
    EXPECT_EQ(formatter.formatUnit(root, FormatStyle::UNICODE), "Hz⁻¹ᐟ²");
    EXPECT_EQ(formatter.formatUnit(root, FormatStyle::LATEX), "\\mathrm{Hz}^{-1/2}");
}

TEST_F(FormatterTest, SymbolReplacements) {
    EXPECT_EQ(formatter.formatUnit(ExponentVector::single("ohm"), FormatStyle::UNICODE), "Ω");
    EXPECT_EQ(formatter.formatUnit(ExponentVector::single("degC"), FormatStyle::UNICODE), "°C");
    EXPECT_EQ(formatter.formatUnit(ExponentVector::single("ohm"), FormatStyle::HTML), "&Omega;");
    EXPECT_EQ(formatter.formatUnit(ExponentVector::single("ohm"), FormatStyle::PLAIN), "ohm");
}

TEST_F(FormatterTest, CustomReplacements) {
    Formatter::Replacements replacements;
    replacements[FormatStyle::PLAIN] = {{"um", "micron"}};
    Formatter custom(replacements);
    EXPECT_EQ(custom.formatUnit(ExponentVector::single("um"), FormatStyle::PLAIN), "micron");
    EXPECT_EQ(custom.formatUnit(ExponentVector::single("ohm"), FormatStyle::UNICODE), "ohm");
}

TEST_F(FormatterTest, SuperscriptDigits) {
    EXPECT_EQ(toSuperscript(0), "⁰");
    EXPECT_EQ(toSuperscript(-12), "⁻¹²");
}

// ============================================================================
// Numbers
// ============================================================================

TEST_F(FormatterTest, ShortestRoundTrip) {
    EXPECT_EQ(formatter.formatNumber(1.0, FormatStyle::PLAIN), "1.0");
    EXPECT_EQ(formatter.formatNumber(1000.0, FormatStyle::PLAIN), "1000.0");
    EXPECT_EQ(formatter.formatNumber(0.1, FormatStyle::PLAIN), "0.1");
    EXPECT_EQ(formatter.formatNumber(299792458.0, FormatStyle::PLAIN), "299792458.0");
    EXPECT_EQ(formatter.formatNumber(1e-10, FormatStyle::PLAIN), "1e-10");
    EXPECT_EQ(formatter.formatNumber(-2.5, FormatStyle::PLAIN), "-2.5");
}

TEST_F(FormatterTest, ExplicitPrecision) {
    NumberFormat nf;
    nf.precision = 2;
    nf.notation = 'f';
    EXPECT_EQ(formatter.formatNumber(1234.0, FormatStyle::PLAIN, nf), "1234.00");

    nf.notation = 'e';
    EXPECT_EQ(formatter.formatNumber(12345.0, FormatStyle::PLAIN, nf), "1.23e+04");
    EXPECT_EQ(formatter.formatNumber(12345.0, FormatStyle::UNICODE, nf), "1.23×10⁴");
}

TEST_F(FormatterTest, WideFixedNotation) {
    NumberFormat nf;
    nf.precision = 2;
    nf.notation = 'f';
    std::string text = formatter.formatNumber(1e80, FormatStyle::PLAIN, nf);
    EXPECT_EQ(text.size(), 84u);
    EXPECT_EQ(text.find('.'), 81u);
    EXPECT_EQ(text.substr(0, 3), "100");
    EXPECT_EQ(text.substr(81), ".00");
}

TEST_F(FormatterTest, NotationLetters) {
    NumberFormat nf;
    nf.precision = 2;
    nf.notation = 'E';
    EXPECT_EQ(formatter.formatNumber(12345.0, FormatStyle::PLAIN, nf), "1.23E+04");
    nf.notation = 'g';
    EXPECT_EQ(formatter.formatNumber(12345.0, FormatStyle::PLAIN, nf), "1.2e+04");
    EXPECT_EQ(formatter.formatNumber(0.5, FormatStyle::PLAIN, nf), "0.5");

    nf.notation = 'n';
    EXPECT_THROW(formatter.formatNumber(1.0, FormatStyle::PLAIN, nf), ParseError);
    nf.notation = 's';
    EXPECT_THROW(formatter.format(1.0, velocity, FormatStyle::PLAIN, nf), ParseError);
}

TEST_F(FormatterTest, StyledExponentials) {
    EXPECT_EQ(formatter.formatNumber(1.5e-10, FormatStyle::UNICODE), "1.5×10⁻¹⁰");
    EXPECT_EQ(formatter.formatNumber(1.5e-10, FormatStyle::HTML), "1.5&times;10<sup>-10</sup>");
    EXPECT_EQ(formatter.formatNumber(1.5e-10, FormatStyle::LATEX), "1.5 \\times 10^{-10}");
    EXPECT_EQ(formatter.formatNumber(1.5e-10, FormatStyle::MODELICA), "1.5e-10");
}

// ============================================================================
// Quantities
// ============================================================================

TEST_F(FormatterTest, NumberAndUnit) {
    EXPECT_EQ(formatter.format(1.0, ExponentVector::single("J"), FormatStyle::PLAIN), "1.0 J");
    EXPECT_EQ(formatter.format(9.81, ExponentVector::fromString("m/s2"), FormatStyle::UNICODE),
              "9.81 m s⁻²");
    EXPECT_EQ(formatter.format(3.0, ExponentVector::single("m"), FormatStyle::HTML), "3.0&nbsp;m");
    EXPECT_EQ(formatter.format(2.5, ExponentVector(), FormatStyle::PLAIN), "2.5");
}

TEST_F(FormatterTest, PrefixOnLeadingTerm) {
    NumberFormat nf;
    EXPECT_EQ(formatter.format(1500.0, ExponentVector::single("m"), FormatStyle::PLAIN, nf, "k"),
              "1.5 km");
    EXPECT_EQ(formatter.format(2e6, ExponentVector::single("m", 2), FormatStyle::PLAIN, nf, "k"),
              "2.0 km2");
    EXPECT_EQ(formatter.format(2500.0, velocity, FormatStyle::PLAIN, nf, "k"), "2.5 km/s");
    EXPECT_THROW(formatter.format(1.0, velocity, FormatStyle::PLAIN, nf, "x"), LookupError);
}
