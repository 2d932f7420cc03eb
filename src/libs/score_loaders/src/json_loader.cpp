#include <score_loaders/json_loader.hpp>
#include <score_core/flowable.hpp>
#include <score_core/log.hpp>
#include <score_core/paper.hpp>
#include <score_staff/bar_line.hpp>
#include <score_staff/clef.hpp>
#include <score_staff/errors.hpp>
#include <score_staff/key_signature.hpp>
#include <score_staff/time_signature.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace score_loaders {

using nlohmann::json;
using score_units::Point;
using score_units::Unit;

namespace {

// Structural problems in an otherwise well-formed JSON document.
class ScoreFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr score_units::UnitType default_length_unit = score_units::unit_types::mm;

double number_or(const json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

Unit length_or(const json& j, const char* key, Unit fallback) {
    return j.contains(key) ? unit_from_json(j[key], default_length_unit) : fallback;
}

Unit required_length(const json& j, const char* key, const char* context) {
    if (!j.contains(key))
        throw ScoreFormatError(std::string(context) + " is missing '" + key + "'");
    return unit_from_json(j[key], default_length_unit);
}

std::string required_string(const json& j, const char* key, const char* context) {
    if (!j.contains(key) || !j[key].is_string())
        throw ScoreFormatError(std::string(context) + " needs a string '" + key + "'");
    return j[key].get<std::string>();
}

// Integer at `key`, or `fallback` when absent. Values outside int are
// rejected rather than narrowed.
int int_or(const json& j, const char* key, int fallback, const char* context) {
    if (!j.contains(key)) return fallback;
    const json& v = j[key];
    if (!v.is_number_integer())
        throw ScoreFormatError(std::string(context) + " needs an integer '" + key + "'");

    bool in_range = false;
    if (v.is_number_unsigned()) {
        in_range = v.get<std::uint64_t>()
            <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        const std::int64_t value = v.get<std::int64_t>();
        in_range = value >= std::numeric_limits<int>::min()
            && value <= std::numeric_limits<int>::max();
    }
    if (!in_range)
        throw ScoreFormatError(std::string(context) + " '" + key + "' is out of range: " + v.dump());
    return static_cast<int>(v.get<std::int64_t>());
}

score_staff::FringeSettings parse_fringe(const json& j, score_staff::FringeSettings base) {
    if (!j.is_object()) return base;
    base.trailing_padding = number_or(j, "trailing_padding", base.trailing_padding);
    base.staff_left_padding = number_or(j, "staff_left_padding", base.staff_left_padding);
    base.time_signature_left_padding = number_or(j, "time_signature_left_padding",
        base.time_signature_left_padding);
    base.key_signature_left_padding = number_or(j, "key_signature_left_padding",
        base.key_signature_left_padding);
    return base;
}

score_core::Paper parse_paper(const json& j) {
    if (j.is_string()) {
        auto preset = score_core::paper_from_preset(j.get<std::string>());
        if (!preset) throw ScoreFormatError("unknown paper preset '" + j.get<std::string>() + "'");
        return *preset;
    }
    if (!j.is_object()) throw ScoreFormatError("paper must be a preset name or an object");

    score_core::Paper paper = score_core::Paper::letter();
    if (j.contains("preset")) paper = parse_paper(j["preset"]);
    paper.width = length_or(j, "width", paper.width);
    paper.height = length_or(j, "height", paper.height);
    paper.margin_top = length_or(j, "margin_top", paper.margin_top);
    paper.margin_right = length_or(j, "margin_right", paper.margin_right);
    paper.margin_bottom = length_or(j, "margin_bottom", paper.margin_bottom);
    paper.margin_left = length_or(j, "margin_left", paper.margin_left);
    paper.gutter = length_or(j, "gutter", paper.gutter);
    if (paper.live_width() <= score_units::zero || paper.live_height() <= score_units::zero)
        throw ScoreFormatError("paper margins leave no live area");
    return paper;
}

void parse_glyphs(const json& j, score_staff::TableFontMetrics& metrics) {
    if (!j.is_object()) throw ScoreFormatError("glyphs must be an object keyed by glyph name");
    for (const auto& [name, bounds] : j.items()) {
        if (!bounds.is_object() || !bounds.contains("width") || !bounds["width"].is_number())
            throw ScoreFormatError("glyph '" + name + "' needs a numeric width");
        metrics.set_glyph(name, score_staff::GlyphBounds{
            bounds["width"].get<double>(), number_or(bounds, "height", 0.0)});
    }
}

void add_modifiers(const json& s, score_staff::Staff& staff) {
    if (s.contains("clefs") && s["clefs"].is_array()) {
        for (const auto& c : s["clefs"]) {
            const std::string type_name = required_string(c, "type", "clef");
            auto type = score_staff::clef_type_from_name(type_name);
            if (!type) throw ScoreFormatError("unknown clef type '" + type_name + "'");
            staff.emplace_child<score_staff::Clef>(length_or(c, "x", score_units::mm(0)), *type);
        }
    }
    if (s.contains("key_signatures") && s["key_signatures"].is_array()) {
        for (const auto& k : s["key_signatures"]) {
            if (!k.contains("fifths"))
                throw ScoreFormatError("key signature needs an integer 'fifths'");
            staff.emplace_child<score_staff::KeySignature>(length_or(k, "x", score_units::mm(0)),
                int_or(k, "fifths", 0, "key signature"));
        }
    }
    if (s.contains("time_signatures") && s["time_signatures"].is_array()) {
        for (const auto& t : s["time_signatures"]) {
            score_staff::Meter meter;
            meter.upper = int_or(t, "upper", meter.upper, "time signature");
            meter.lower = int_or(t, "lower", meter.lower, "time signature");
            staff.emplace_child<score_staff::TimeSignature>(length_or(t, "x", score_units::mm(0)), meter);
        }
    }
}

// Measures every modifier once so missing glyphs and key signatures without
// an active clef fail here instead of in the first render pass.
void check_modifiers(const score_staff::Staff& staff) {
    for (const auto& entry : staff.clefs())
        entry.object->bounding_width();
    for (const auto& entry : staff.key_signatures()) {
        entry.object->visual_width();
        if (entry.object->accidental_count() > 0) entry.object->accidental_positions();
    }
    for (const auto& entry : staff.time_signatures())
        entry.object->visual_width();
}

score_staff::Staff& staff_by_id(const LoadedScore& score, const json& id) {
    if (!id.is_string()) throw ScoreFormatError("staff references must be strings");
    auto it = score.staves_by_id.find(id.get<std::string>());
    if (it == score.staves_by_id.end())
        throw ScoreFormatError("unknown staff '" + id.get<std::string>() + "'");
    return *it->second;
}

LoadedScore parse_score(const json& j) {
    if (!j.is_object()) throw ScoreFormatError("score must be a JSON object");
    if (!j.contains("staves") || !j["staves"].is_array())
        throw ScoreFormatError("score needs a 'staves' array");

    LoadedScore score;
    score.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : "";

    score.metrics = std::make_unique<score_staff::TableFontMetrics>(
        score_staff::TableFontMetrics::bravura_subset());
    if (j.contains("glyphs")) parse_glyphs(j["glyphs"], *score.metrics);

    score_staff::EngravingSettings engraving;
    if (j.contains("engraving")) {
        auto parsed = load_engraving_settings_from_json(j["engraving"]);
        if (!parsed) throw ScoreFormatError("invalid engraving settings");
        engraving = *parsed;
    }

    const score_core::Paper paper = j.contains("paper") ? parse_paper(j["paper"])
                                                        : score_core::Paper::letter();
    score.document = std::make_unique<score_core::Document>(paper,
        length_or(j, "page_gap", score_units::mm(50)));

    score_core::PositionedObject* staff_parent = &score.document->page(0);
    if (j.contains("flowable")) {
        const json& f = j["flowable"];
        if (!f.is_object()) throw ScoreFormatError("flowable must be an object");
        staff_parent = &staff_parent->emplace_child<score_core::Flowable>(
            Point{length_or(f, "x", score_units::mm(0)), length_or(f, "y", score_units::mm(0))},
            required_length(f, "length", "flowable"),
            required_length(f, "height", "flowable"),
            length_or(f, "y_padding", score_units::mm(5)));
    }

    for (const auto& s : j["staves"]) {
        const std::string id = required_string(s, "id", "staff");
        if (score.staves_by_id.count(id))
            throw ScoreFormatError("duplicate staff id '" + id + "'");
        const int line_count = int_or(s, "line_count", 5, "staff");
        auto& staff = staff_parent->emplace_child<score_staff::Staff>(
            Point{length_or(s, "x", score_units::mm(0)), length_or(s, "y", score_units::mm(0))},
            required_length(s, "length", "staff"), *score.metrics,
            length_or(s, "line_spacing", score_units::mm(1.75)), line_count);
        staff.set_engraving_settings(engraving);
        add_modifiers(s, staff);
        check_modifiers(staff);
        score.staves_by_id.emplace(id, &staff);
    }

    if (j.contains("groups") && j["groups"].is_array()) {
        for (const auto& g : j["groups"]) {
            if (!g.is_array()) throw ScoreFormatError("each group must be an array of staff ids");
            auto group = std::make_unique<score_staff::StaffGroup>(engraving.group_fringe);
            for (const auto& id : g)
                group->add_staff(staff_by_id(score, id));
            score.groups.push_back(std::move(group));
        }
    }

    if (j.contains("bar_lines") && j["bar_lines"].is_array()) {
        for (const auto& b : j["bar_lines"]) {
            if (!b.contains("staves") || !b["staves"].is_array())
                throw ScoreFormatError("bar line needs a 'staves' array");
            std::vector<score_staff::Staff*> staves;
            for (const auto& id : b["staves"])
                staves.push_back(&staff_by_id(score, id));
            score_staff::add_bar_line(required_length(b, "x", "bar line"), staves);
        }
    }

    return score;
}

} // namespace

Unit unit_from_json(const json& value, score_units::UnitType target) {
    if (value.is_number()) return Unit(value.get<double>(), target);
    if (value.is_string()) return score_units::parse_unit(value.get<std::string>(), target);
    throw score_units::TypeConversionError("expected a number or a length string, got "
        + value.dump());
}

std::optional<score_staff::EngravingSettings> load_engraving_settings_from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;
    score_staff::EngravingSettings settings;
    if (j.contains("staff_fringe"))
        settings.staff_fringe = parse_fringe(j["staff_fringe"], settings.staff_fringe);
    if (j.contains("group_fringe"))
        settings.group_fringe = parse_fringe(j["group_fringe"], settings.group_fringe);
    settings.staff_line_thickness = number_or(j, "staff_line_thickness", settings.staff_line_thickness);
    settings.bar_line_thickness = number_or(j, "bar_line_thickness", settings.bar_line_thickness);
    return settings;
}

std::optional<LoadedScore> load_score_from_json(std::istream& in) {
    auto logger = score_core::layout_logger();
    try {
        const json j = json::parse(in);
        LoadedScore score = parse_score(j);
        logger->info("score_loaded name='{}' staves={} groups={}", score.name,
            score.staves_by_id.size(), score.groups.size());
        return score;
    } catch (const json::exception& e) {
        logger->warn("score_json_invalid reason={}", e.what());
    } catch (const ScoreFormatError& e) {
        logger->warn("score_format_invalid reason={}", e.what());
    } catch (const score_staff::NoClefError& e) {
        logger->warn("score_clef_missing reason={}", e.what());
    } catch (const score_staff::GlyphLookupError& e) {
        logger->warn("score_glyph_missing reason={}", e.what());
    } catch (const std::invalid_argument& e) {
        // Bad lengths, key signatures and meters.
        logger->warn("score_value_invalid reason={}", e.what());
    } catch (const std::logic_error& e) {
        logger->warn("score_structure_invalid reason={}", e.what());
    }
    return std::nullopt;
}

std::optional<LoadedScore> load_score_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_score_from_json(f);
}

} // namespace score_loaders
