/**
 * @file test_unit_system.cpp
 * @brief Unit tests for the SI unit system built from the bundled definitions
 */

#include <gtest/gtest.h>
#include "UnitSystem.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <sstream>
#include <cmath>

using namespace PQS;

class UnitSystemTest : public ::testing::Test {
protected:
    UnitSystem units;

    static bool has(const std::vector<std::string>& names, const std::string& name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    }
};

// ============================================================================
// Lookup
// ============================================================================

TEST_F(UnitSystemTest, LookupKinds) {
    EXPECT_EQ(units.kindOf("c"), SymbolKind::CONSTANT);
    EXPECT_EQ(units.kindOf("m"), SymbolKind::UNIT);
    EXPECT_EQ(units.kindOf("km"), SymbolKind::UNIT);
    EXPECT_EQ(units.kindOf("degC"), SymbolKind::LAMBDA_UNIT);

    EXPECT_TRUE(std::holds_alternative<Constant>(units.lookup("k_B")));
    EXPECT_TRUE(std::holds_alternative<Unit>(units.lookup("J")));
}

TEST_F(UnitSystemTest, UnknownNames) {
    EXPECT_FALSE(units.hasSymbol("furlong"));
    EXPECT_THROW(units.lookup("furlong"), LookupError);
    // kg carries no prefixes
    EXPECT_THROW(units.lookup("kkg"), LookupError);
    // constants carry no prefixes
    EXPECT_THROW(units.lookup("kc"), LookupError);

    try {
        units.lookup("furlong");
        FAIL() << "Expected LookupError";
    } catch (const LookupError& e) {
        EXPECT_EQ(e.name(), "furlong");
    }
}

TEST_F(UnitSystemTest, SiBaseUnitsAreUnity) {
    for (const char* name : {"m", "s", "kg", "A", "K", "mol", "rad"}) {
        EXPECT_EQ(units.quantity(name).value(), 1.0) << name;
    }
    EXPECT_EQ(units.quantity("J").value(), 1.0);
    EXPECT_EQ(units.quantity("c").value(), 299792458.0);
}

TEST_F(UnitSystemTest, PrefixedUnits) {
    EXPECT_NEAR(units.quantity("mg").value(), 1e-6, 1e-21);
    EXPECT_DOUBLE_EQ(units.quantity("kPa").value(), 1000.0);
    // deci-are, not deca
    EXPECT_EQ(units.quantity("da").dimension(), ExponentVector::single("L", 2));
    EXPECT_NEAR(units.quantity("da").value(), 10.0, 1e-12);
}

TEST_F(UnitSystemTest, LambdaUnitAccess) {
    LambdaUnit degF = units.lambdaUnit("degF");
    EXPECT_NEAR(degF.toNumber(degF.toQuantity(98.6)), 98.6, 1e-12);
    EXPECT_THROW(units.lambdaUnit("m"), UnitError);
    EXPECT_THROW(units.quantity("degC"), UnitError);
}

TEST_F(UnitSystemTest, UnitExpressions) {
    Quantity u = units.unitExpression("W/(m2*K)");
    EXPECT_EQ(u.dimension(), ExponentVector::fromString("M/(T3*Theta)"));
    EXPECT_EQ(u.displayUnit(), ExponentVector::fromString("W/(m2*K)"));
    EXPECT_DOUBLE_EQ(u.value(), 1.0);

    EXPECT_THROW(units.unitExpression("degC*m"), UnitError);
    EXPECT_THROW(units.unitExpression("furlong/s"), LookupError);
}

TEST_F(UnitSystemTest, UnitExpressionsWithDigitsInNames) {
    Quantity weight = units.unitExpression("g_0*kg");
    EXPECT_NEAR(weight.value(), 9.80665, 1e-12);
    EXPECT_EQ(weight.dimension(), ExponentVector::fromString("L*M/T2"));
    EXPECT_EQ(weight.displayUnit(), (ExponentVector{{"g_0", 1}, {"kg", 1}}));

    // mu_0*epsilon_0 is 1/c2
    Quantity product = units.unitExpression("mu_0*epsilon_0");
    EXPECT_EQ(product.dimension(), ExponentVector::fromString("T2/L2"));
    EXPECT_NEAR(product.value() * 299792458.0 * 299792458.0, 1.0, 1e-12);

    EXPECT_NEAR(units.convert(units.make(1.0, "lbf"), "g_0*lb"), 1.0, 1e-12);
    EXPECT_THROW(units.unitExpression("m0*kg"), ParseError);
}

// ============================================================================
// Conversion
// ============================================================================

TEST_F(UnitSystemTest, KilometerIsExactlyOneThousandMeters) {
    EXPECT_EQ(units.convert(1.0, "km", "m"), 1000.0);
    EXPECT_EQ(units.quantity("km").divide(units.quantity("m")).toNumber(), 1000.0);
}

TEST_F(UnitSystemTest, CommonConversions) {
    EXPECT_DOUBLE_EQ(units.convert(1.0, "hr", "s"), 3600.0);
    EXPECT_NEAR(units.convert(1.0, "mi", "km"), 1.609344, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "psi", "Pa"), 6894.757293168, 1e-6);
    EXPECT_NEAR(units.convert(1.0, "atm", "bar"), 1.01325, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "cal", "J"), 4.184, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "L", "cm3"), 1000.0, 1e-9);

    auto minutes = units.convert(std::vector<double>{1.0, 2.0}, "hr", "min");
    ASSERT_EQ(minutes.size(), 2u);
    EXPECT_DOUBLE_EQ(minutes[1], 120.0);
}

TEST_F(UnitSystemTest, TemperatureConversions) {
    EXPECT_NEAR(units.convert(0.0, "degC", "K"), 273.15, 1e-12);
    EXPECT_NEAR(units.convert(100.0, "degC", "degF"), 212.0, 1e-9);
    EXPECT_NEAR(units.convert(-40.0, "degF", "degC"), -40.0, 1e-9);
    EXPECT_NEAR(units.convert(300.0, "K", "mdegC"), 26850.0, 1e-7);
}

TEST_F(UnitSystemTest, LogarithmicUnits) {
    Quantity gain = units.make(20.0, "dB");
    EXPECT_NEAR(gain.toNumber(), 100.0, 1e-9);
    EXPECT_NEAR(units.convert(Quantity(1000.0), "dB"), 30.0, 1e-9);
}

TEST_F(UnitSystemTest, IncompatibleUnits) {
    EXPECT_THROW(units.convert(1.0, "m", "s"), IncompatibleUnitError);
    EXPECT_THROW(units.convert(1.0, "degC", "m"), IncompatibleUnitError);
    EXPECT_FALSE(units.areCompatible("m", "s"));
    EXPECT_TRUE(units.areCompatible("J", "eV"));
    EXPECT_TRUE(units.areCompatible("degC", "K"));
    EXPECT_TRUE(units.areCompatible("N*m", "kg*m2/s2"));
    EXPECT_FALSE(units.areCompatible("furlong", "m"));
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(UnitSystemTest, ParseValueWithUnit) {
    double value;
    std::string unit;

    ASSERT_TRUE(units.parseValueWithUnit("-1.5e3 kg*m/s2", value, unit));
    EXPECT_DOUBLE_EQ(value, -1500.0);
    EXPECT_EQ(unit, "kg*m/s2");

    // An 'e' followed by a letter starts the unit
    ASSERT_TRUE(units.parseValueWithUnit("5 eV", value, unit));
    EXPECT_DOUBLE_EQ(value, 5.0);
    EXPECT_EQ(unit, "eV");

    ASSERT_TRUE(units.parseValueWithUnit("42", value, unit));
    EXPECT_TRUE(unit.empty());

    EXPECT_FALSE(units.parseValueWithUnit("fast", value, unit));
    EXPECT_FALSE(units.parseValueWithUnit("", value, unit));
}

TEST_F(UnitSystemTest, ParseQuantity) {
    Quantity energy = units.parseQuantity("5 eV");
    EXPECT_NEAR(units.convert(energy, "J"), 8.010882825e-19, 1e-26);

    Quantity hot = units.parseQuantity("25 degC");
    EXPECT_NEAR(units.convert(hot, "K"), 298.15, 1e-12);

    EXPECT_THROW(units.parseQuantity("fast"), ParseError);
    EXPECT_THROW(units.parseQuantity("3 furlong"), LookupError);
}

// ============================================================================
// Algebra
// ============================================================================

TEST_F(UnitSystemTest, PowerOfPower) {
    Quantity a = units.parseQuantity("8 km");
    Quantity lhs = a.power(Rational(3, 2)).power(Rational(2, 3));
    Quantity rhs = a.power(Rational(3, 2) * Rational(2, 3));
    EXPECT_EQ(lhs.dimension(), rhs.dimension());
    EXPECT_NEAR(lhs.value(), rhs.value(), 1e-9);
}

TEST_F(UnitSystemTest, ProductsLeaveNoCrossTerms) {
    Quantity force = units.make(3.0, "N");
    Quantity distance = units.make(2.0, "m");
    Quantity work = force * distance;
    EXPECT_EQ(units.format(work), "6.0 J");

    Quantity power = work / units.make(2.0, "s");
    EXPECT_EQ(units.format(power), "3.0 W");

    EXPECT_EQ(units.simplify(ExponentVector::fromString("kg*m2/s2")), ExponentVector::single("J"));
}

// ============================================================================
// Display
// ============================================================================

TEST_F(UnitSystemTest, CoherentFormat) {
    Quantity energy(1.0, ExponentVector::fromString("L2*M/T2"));
    EXPECT_EQ(units.format(energy), "1.0 J");
    EXPECT_EQ(units.format(energy, FormatStyle::UNICODE), "1.0 J");

    Quantity speed(3.0, ExponentVector::fromString("L/T"));
    EXPECT_EQ(units.format(speed), "3.0 m/s");
}

TEST_F(UnitSystemTest, NaturalUnitsForComputedDimensions) {
    EXPECT_EQ(units.format(Quantity(1.0, ExponentVector::fromString("T-1"))), "1.0 Hz");
    EXPECT_EQ(units.format(Quantity(9.81, ExponentVector::fromString("L/T2"))), "9.81 m/s2");
    EXPECT_EQ(units.format(Quantity(2.0, ExponentVector::fromString("L*M/T"))), "2.0 N*s");
    EXPECT_EQ(units.format(Quantity(4.0, ExponentVector::fromString("L2"))), "4.0 m2");
}

TEST_F(UnitSystemTest, FormatKeepsDisplayUnit) {
    EXPECT_EQ(units.format(units.make(1.5, "km")), "1.5 km");

    NumberFormat nf;
    nf.precision = 2;
    nf.notation = 'f';
    EXPECT_EQ(units.format(units.make(25.0, "degC"), FormatStyle::PLAIN, nf), "25.00 degC");
}

TEST_F(UnitSystemTest, FormatIn) {
    Quantity length = units.make(1500.0, "m");
    NumberFormat nf;
    EXPECT_EQ(units.formatIn(length, "m", FormatStyle::PLAIN, nf, "k"), "1.5 km");

    nf.precision = 1;
    nf.notation = 'f';
    EXPECT_EQ(units.formatIn(units.make(100.0, "degC"), "degF", FormatStyle::PLAIN, nf),
              "212.0 degF");
    EXPECT_THROW(units.formatIn(length, "s"), IncompatibleUnitError);
}

// ============================================================================
// Listing
// ============================================================================

TEST_F(UnitSystemTest, Sections) {
    auto sections = units.getSections();
    ASSERT_FALSE(sections.empty());
    EXPECT_EQ(sections.front(), "Base constants");
    EXPECT_TRUE(has(sections, "Derived units"));

    auto time = units.getSymbolsInSection("Time");
    ASSERT_EQ(time.size(), 3u);
    EXPECT_EQ(time[0], "min");
    EXPECT_EQ(time[2], "d");
}

TEST_F(UnitSystemTest, PrefixableUnitsAndDimensions) {
    auto prefixable = units.getPrefixableUnits();
    EXPECT_TRUE(has(prefixable, "m"));
    EXPECT_TRUE(has(prefixable, "degC"));
    EXPECT_FALSE(has(prefixable, "kg"));
    EXPECT_FALSE(has(prefixable, "c"));

    auto energies = units.getSymbolsWithDimension(ExponentVector::fromString("L2*M/T2"));
    ASSERT_FALSE(energies.empty());
    EXPECT_EQ(energies.front(), "J");
    EXPECT_TRUE(has(energies, "eV"));
    EXPECT_FALSE(has(energies, "E_h"));
}

TEST_F(UnitSystemTest, DatabaseOutput) {
    std::ostringstream os;
    units.printDatabase(os);
    EXPECT_NE(os.str().find("Unit System Database"), std::string::npos);
    EXPECT_NE(os.str().find("degree Celsius"), std::string::npos);

    std::string docs = units.generateDocumentation();
    EXPECT_NE(docs.find("## Derived units"), std::string::npos);
    EXPECT_NE(docs.find("| J | unit |"), std::string::npos);
}

// ============================================================================
// In-memory Systems
// ============================================================================

TEST_F(UnitSystemTest, LastDefinitionWins) {
    std::vector<DefinitionSource> sources = {DefinitionSource::fromString("a.ini", "x = 5\n"),
                                             DefinitionSource::fromString("b.ini", "x = 7\n")};
    UnitSystem custom(sources);
    EXPECT_DOUBLE_EQ(custom.quantity("x").value(), 7.0);
}

TEST_F(UnitSystemTest, IndependentInstances) {
    UnitSystem toy(std::vector<DefinitionSource>{DefinitionSource::fromString("toy.ini",
        "m = Quantity(2,'L'), True\n"
        "s = Quantity(1,'T'), True\n")});
    EXPECT_DOUBLE_EQ(toy.convert(1.0, "km", "m"), 1000.0);
    EXPECT_DOUBLE_EQ(toy.quantity("m").value(), 2.0);
    EXPECT_EQ(units.quantity("m").value(), 1.0);
    EXPECT_FALSE(toy.hasSymbol("J"));
}
