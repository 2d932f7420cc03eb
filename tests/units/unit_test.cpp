// Tests for score_units: typed lengths, conversion and parsing.

#include <gtest/gtest.h>

#include <score_units/point.hpp>
#include <score_units/unit.hpp>

namespace {

using score_units::Unit;
using score_units::mm;

// ---------------------------------------------------------------------------
// Conversion
// ---------------------------------------------------------------------------

TEST(Unit, InchIsSeventyTwoBaseUnits) {
    EXPECT_DOUBLE_EQ(score_units::inches(1).base_value(), 72.0);
    EXPECT_DOUBLE_EQ(Unit(score_units::inches(1), score_units::unit_types::mm).value(), 25.4);
}

TEST(Unit, ConvertKeepsBaseValue) {
    const Unit a = mm(12.5);
    const Unit b = score_units::convert(a, score_units::unit_types::inch);
    EXPECT_EQ(b.type(), score_units::unit_types::inch);
    EXPECT_NEAR(b.base_value(), a.base_value(), 1e-9);
}

TEST(Unit, ArithmeticUsesLeftOperandUnit) {
    const Unit sum = mm(10) + score_units::inches(1);
    EXPECT_EQ(sum.type(), score_units::unit_types::mm);
    EXPECT_NEAR(sum.value(), 35.4, 1e-9);

    const Unit diff = score_units::inches(1) - mm(25.4);
    EXPECT_EQ(diff.type(), score_units::unit_types::inch);
    EXPECT_NEAR(diff.value(), 0.0, 1e-12);
}

TEST(Unit, ScalarOperations) {
    EXPECT_EQ(mm(3) * 2.0, mm(6));
    EXPECT_EQ(mm(3) / 2.0, mm(1.5));
    EXPECT_DOUBLE_EQ(mm(6) / mm(3), 2.0);
    EXPECT_EQ(-mm(3), mm(-3));
    EXPECT_EQ(score_units::abs(mm(-4)), mm(4));
}

TEST(Unit, ComparisonsConvert) {
    EXPECT_LT(mm(25), score_units::inches(1));
    EXPECT_GT(mm(26), score_units::inches(1));
    EXPECT_EQ(score_units::zero, mm(0));
    EXPECT_LE(mm(0), score_units::zero);
}

TEST(Unit, CustomUnitTypeScalesByRatio) {
    const score_units::UnitType staff_space{"staff units", mm(2).base_value()};
    const Unit four(4.0, staff_space);
    EXPECT_NEAR(Unit(four, score_units::unit_types::mm).value(), 8.0, 1e-9);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST(ParseUnit, BareNumberTakesTargetUnit) {
    const Unit u = score_units::parse_unit("12", score_units::unit_types::mm);
    EXPECT_EQ(u.type(), score_units::unit_types::mm);
    EXPECT_DOUBLE_EQ(u.value(), 12.0);
}

TEST(ParseUnit, SuffixIsConvertedToTarget) {
    const Unit u = score_units::parse_unit(" 1in ", score_units::unit_types::mm);
    EXPECT_NEAR(u.value(), 25.4, 1e-9);

    const Unit pt = score_units::parse_unit("72pt");
    EXPECT_DOUBLE_EQ(pt.value(), 72.0);
    EXPECT_DOUBLE_EQ(score_units::parse_unit("3u").value(), 3.0);
}

TEST(ParseUnit, RejectsGarbage) {
    EXPECT_THROW(score_units::parse_unit("abc"), score_units::TypeConversionError);
    EXPECT_THROW(score_units::parse_unit(""), score_units::TypeConversionError);
    EXPECT_THROW(score_units::parse_unit("5furlongs"), score_units::TypeConversionError);
}

TEST(ParseUnit, SuffixLookup) {
    EXPECT_TRUE(score_units::unit_type_from_suffix("mm").has_value());
    EXPECT_FALSE(score_units::unit_type_from_suffix("cm").has_value());
}

// ---------------------------------------------------------------------------
// Point
// ---------------------------------------------------------------------------

TEST(Point, AddsComponentwise) {
    const score_units::Point a{mm(1), mm(2)};
    const score_units::Point b{mm(3), mm(4)};
    EXPECT_EQ(a + b, (score_units::Point{mm(4), mm(6)}));
    EXPECT_EQ(b - a, (score_units::Point{mm(2), mm(2)}));
    EXPECT_EQ(a * 2.0, (score_units::Point{mm(2), mm(4)}));
}

} // namespace
