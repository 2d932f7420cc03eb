// Tests for Staff geometry and its active-modifier index.

#include <gtest/gtest.h>

#include <score_core/document.hpp>
#include <score_core/flowable.hpp>
#include <score_staff/clef.hpp>
#include <score_staff/errors.hpp>
#include <score_staff/key_signature.hpp>
#include <score_staff/staff.hpp>
#include <score_staff/time_signature.hpp>

#include <stdexcept>

#include "test_helpers.h"

namespace {

using score_core::Document;
using score_core::Flowable;
using score_staff::Clef;
using score_staff::ClefType;
using score_staff::KeySignature;
using score_staff::Meter;
using score_staff::Staff;
using score_staff::TimeSignature;
using score_units::Point;
using score_units::mm;

class StaffTest : public ::testing::Test {
protected:
    StaffTest()
        : metrics_(score_test::fake_metrics()),
          flowable_(doc_.page(0).emplace_child<Flowable>(Point{mm(0), mm(0)}, mm(400), mm(30))),
          staff_(flowable_.emplace_child<Staff>(Point{mm(0), mm(0)}, mm(400), metrics_)) {}

    score_staff::TableFontMetrics metrics_;
    Document doc_;
    Flowable& flowable_;
    Staff& staff_;
};

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

TEST_F(StaffTest, StaffUnitIsOneLineSpacing) {
    EXPECT_NEAR(staff_.unit(1).base_value(), mm(1.75).base_value(), 1e-12);
    EXPECT_EQ(staff_.height(), staff_.unit(4));
    EXPECT_EQ(staff_.center_y(), staff_.unit(2));
    EXPECT_EQ(staff_.barline_extent().first, staff_.unit(0));
    EXPECT_EQ(staff_.barline_extent().second, staff_.unit(4));
    EXPECT_EQ(staff_.breakable_length(), mm(400));
}

TEST(Staff, SingleLineBarlineExtent) {
    auto metrics = score_test::fake_metrics();
    Staff staff(Point{}, mm(100), metrics, mm(2), 1);
    EXPECT_EQ(staff.height(), staff.unit(0));
    EXPECT_EQ(staff.barline_extent().first, staff.unit(-1));
    EXPECT_EQ(staff.barline_extent().second, staff.unit(1));
}

TEST(Staff, RejectsDegenerateGeometry) {
    auto metrics = score_test::fake_metrics();
    EXPECT_THROW(Staff(Point{}, mm(100), metrics, mm(2), 0), std::invalid_argument);
    EXPECT_THROW(Staff(Point{}, mm(100), metrics, mm(0)), std::invalid_argument);
}

TEST_F(StaffTest, LedgerQueries) {
    EXPECT_TRUE(staff_.y_inside_staff(staff_.unit(2)));
    EXPECT_TRUE(staff_.y_inside_staff(staff_.unit(4)));
    EXPECT_FALSE(staff_.y_inside_staff(staff_.unit(-0.5)));

    EXPECT_TRUE(staff_.y_on_ledger(staff_.unit(-1)));
    EXPECT_TRUE(staff_.y_on_ledger(staff_.unit(6)));
    EXPECT_FALSE(staff_.y_on_ledger(staff_.unit(-1.5)));
    EXPECT_FALSE(staff_.y_on_ledger(staff_.unit(3)));

    const auto above = staff_.ledgers_needed_for_y(staff_.unit(-2.5));
    ASSERT_EQ(above.size(), 2u);
    EXPECT_EQ(above[0], staff_.unit(-2));
    EXPECT_EQ(above[1], staff_.unit(-1));

    const auto below = staff_.ledgers_needed_for_y(staff_.unit(6));
    ASSERT_EQ(below.size(), 2u);
    EXPECT_EQ(below[0], staff_.unit(6));
    EXPECT_EQ(below[1], staff_.unit(5));

    EXPECT_TRUE(staff_.ledgers_needed_for_y(staff_.unit(2)).empty());
}

// ---------------------------------------------------------------------------
// Modifier index
// ---------------------------------------------------------------------------

TEST_F(StaffTest, ActiveClefIsLastAtOrBefore) {
    auto& treble = staff_.emplace_child<Clef>(mm(10), ClefType::Treble);
    auto& bass = staff_.emplace_child<Clef>(mm(100), ClefType::Bass);

    EXPECT_EQ(staff_.active_clef_at(mm(0)), nullptr);
    EXPECT_EQ(staff_.active_clef_at(mm(10)), &treble);
    EXPECT_EQ(staff_.active_clef_at(mm(99)), &treble);
    EXPECT_EQ(staff_.active_clef_at(mm(100)), &bass);
    EXPECT_EQ(staff_.active_clef_at(mm(400)), &bass);
}

TEST_F(StaffTest, IndexIsSortedByPosition) {
    staff_.emplace_child<Clef>(mm(200), ClefType::Bass);
    staff_.emplace_child<Clef>(mm(0), ClefType::Treble);
    staff_.emplace_child<Clef>(mm(50), ClefType::Alto);

    const auto& clefs = staff_.clefs();
    ASSERT_EQ(clefs.size(), 3u);
    EXPECT_EQ(clefs[0].pos_x, mm(0));
    EXPECT_EQ(clefs[1].pos_x, mm(50));
    EXPECT_EQ(clefs[2].pos_x, mm(200));
}

TEST_F(StaffTest, NestedModifiersAreIndexedAtTheirStaffPosition) {
    auto& holder = staff_.emplace_child<score_core::PositionedObject>(Point{mm(30), mm(0)});
    auto& clef = holder.emplace_child<Clef>(mm(5), ClefType::Treble);

    ASSERT_EQ(staff_.clefs().size(), 1u);
    EXPECT_EQ(staff_.clefs()[0].pos_x, mm(35));
    EXPECT_EQ(staff_.active_clef_at(mm(35)), &clef);
    EXPECT_EQ(clef.pos_x_in_staff(), mm(35));
}

TEST_F(StaffTest, ActiveKeySignature) {
    auto& first = staff_.emplace_child<KeySignature>(mm(0), 2);
    auto& second = staff_.emplace_child<KeySignature>(mm(150), -3);

    EXPECT_EQ(staff_.active_key_signature_at(mm(0)), &first);
    EXPECT_EQ(staff_.active_key_signature_at(mm(149)), &first);
    EXPECT_EQ(staff_.active_key_signature_at(mm(150)), &second);
}

TEST_F(StaffTest, TimeSignatureOnlyActiveAtItsPosition) {
    auto& time_sig = staff_.emplace_child<TimeSignature>(mm(40), Meter{3, 4});

    EXPECT_EQ(staff_.time_signature_at(mm(40)), &time_sig);
    EXPECT_EQ(staff_.time_signature_at(mm(41)), nullptr);
    EXPECT_EQ(staff_.time_signature_at(mm(39)), nullptr);
}

TEST_F(StaffTest, MiddleCFollowsActiveClef) {
    staff_.emplace_child<Clef>(mm(10), ClefType::Treble);
    staff_.emplace_child<Clef>(mm(100), ClefType::Bass);

    EXPECT_EQ(staff_.middle_c_at(mm(50)), staff_.unit(5));
    EXPECT_EQ(staff_.middle_c_at(mm(120)), staff_.unit(-1));
    EXPECT_THROW(staff_.middle_c_at(mm(5)), score_staff::NoClefError);
}

TEST_F(StaffTest, DistanceToNextOfType) {
    auto& first = staff_.emplace_child<Clef>(mm(0), ClefType::Treble);
    staff_.emplace_child<KeySignature>(mm(50), 1);
    auto& last = staff_.emplace_child<Clef>(mm(120), ClefType::Bass);

    EXPECT_EQ(staff_.distance_to_next_of_type(first), mm(120));
    EXPECT_EQ(staff_.distance_to_next_of_type(last), staff_.breakable_length() - mm(120));
    EXPECT_EQ(first.breakable_length(), mm(120));
}

TEST_F(StaffTest, IndexTracksTreeMutations) {
    auto& treble = staff_.emplace_child<Clef>(mm(0), ClefType::Treble);
    EXPECT_EQ(staff_.active_clef_at(mm(200)), &treble);

    auto& bass = staff_.emplace_child<Clef>(mm(100), ClefType::Bass);
    EXPECT_EQ(staff_.active_clef_at(mm(200)), &bass);

    bass.set_x(mm(300));
    EXPECT_EQ(staff_.active_clef_at(mm(200)), &treble);

    auto removed = bass.detach();
    EXPECT_EQ(staff_.clefs().size(), 1u);
    EXPECT_EQ(staff_.active_clef_at(mm(350)), &treble);
}

// ---------------------------------------------------------------------------
// Break positions
// ---------------------------------------------------------------------------

TEST(Staff, BreakPositionIsClampedToStaffStart) {
    auto metrics = score_test::fake_metrics();
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{}, mm(400), mm(30));
    auto& staff = flowable.emplace_child<Staff>(Point{mm(20), mm(0)}, mm(300), metrics);

    const auto& lines = flowable.lines();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(staff.staff_pos_x_at(&lines[0]), score_units::zero);
    EXPECT_EQ(staff.staff_pos_x_at(nullptr), score_units::zero);
    EXPECT_NEAR(staff.staff_pos_x_at(&lines[1]).value(), lines[1].flowable_x.value() - 20, 1e-9);
}

TEST(Staff, StaffOutsideFlowableUsesPositionZero) {
    auto metrics = score_test::fake_metrics();
    Document doc;
    auto& staff = doc.page(0).emplace_child<Staff>(Point{mm(10), mm(10)}, mm(100), metrics);
    EXPECT_EQ(staff.flowable(), nullptr);
    EXPECT_EQ(staff.staff_pos_x_at_flowable_x(mm(50)), score_units::zero);
}

} // namespace
