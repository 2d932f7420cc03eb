#include <score_loaders/debug_score.hpp>
#include <score_core/flowable.hpp>
#include <score_staff/bar_line.hpp>
#include <score_staff/clef.hpp>
#include <score_staff/key_signature.hpp>
#include <score_staff/time_signature.hpp>

namespace score_loaders {

using score_units::mm;
using score_units::Point;

LoadedScore generate_debug_score() {
    LoadedScore out;
    out.name = "Grand staff (debug)";
    out.metrics = std::make_unique<score_staff::TableFontMetrics>(
        score_staff::TableFontMetrics::bravura_subset());
    out.document = std::make_unique<score_core::Document>(score_core::Paper::letter());

    auto& flowable = out.document->page(0).emplace_child<score_core::Flowable>(
        Point{mm(0), mm(10)}, mm(640), mm(35));

    auto add_staff = [&](const char* id, double y, score_staff::ClefType clef) -> score_staff::Staff& {
        auto& staff = flowable.emplace_child<score_staff::Staff>(Point{mm(0), mm(y)}, mm(640),
            *out.metrics);
        staff.emplace_child<score_staff::Clef>(mm(0), clef);
        staff.emplace_child<score_staff::KeySignature>(mm(0), 2);
        staff.emplace_child<score_staff::TimeSignature>(mm(0), score_staff::Meter{3, 4});
        out.staves_by_id.emplace(id, &staff);
        return staff;
    };

    auto& upper = add_staff("upper", 0, score_staff::ClefType::Treble);
    auto& lower = add_staff("lower", 15, score_staff::ClefType::Bass);

    // Changes mid-score so later lines carry different fringes.
    for (score_staff::Staff* staff : {&upper, &lower}) {
        staff->emplace_child<score_staff::KeySignature>(mm(260), -3);
        staff->emplace_child<score_staff::TimeSignature>(mm(260), score_staff::Meter{6, 8});
    }
    lower.emplace_child<score_staff::Clef>(mm(420), score_staff::ClefType::Tenor);
    upper.emplace_child<score_staff::KeySignature>(mm(520), 5);

    auto group = std::make_unique<score_staff::StaffGroup>();
    group->add_staff(upper);
    group->add_staff(lower);
    out.groups.push_back(std::move(group));

    for (double x = 40; x < 640; x += 40)
        score_staff::add_bar_line(mm(x), {&upper, &lower});

    return out;
}

} // namespace score_loaders
