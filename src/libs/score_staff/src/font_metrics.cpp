#include <score_staff/font_metrics.hpp>
#include <utility>

namespace score_staff {

TableFontMetrics::TableFontMetrics(std::unordered_map<std::string, GlyphBounds> glyphs)
    : glyphs_(std::move(glyphs)) {}

void TableFontMetrics::set_glyph(const std::string& glyph_name, GlyphBounds bounds) {
    glyphs_[glyph_name] = bounds;
}

std::optional<GlyphBounds> TableFontMetrics::glyph_bounds(const std::string& glyph_name) const {
    auto it = glyphs_.find(glyph_name);
    if (it == glyphs_.end()) return std::nullopt;
    return it->second;
}

TableFontMetrics TableFontMetrics::bravura_subset() {
    return TableFontMetrics({
        {"gClef", {2.684, 7.024}},
        {"fClef", {2.756, 3.528}},
        {"cClef", {2.796, 4.048}},
        {"unpitchedPercussionClef1", {1.528, 2.0}},
        {"accidentalSharp", {0.996, 2.792}},
        {"accidentalFlat", {0.904, 2.456}},
        {"accidentalNatural", {0.672, 2.7}},
        {"timeSig0", {1.8, 2.0}},
        {"timeSig1", {1.26, 2.0}},
        {"timeSig2", {1.72, 2.0}},
        {"timeSig3", {1.64, 2.0}},
        {"timeSig4", {1.8, 2.0}},
        {"timeSig5", {1.64, 2.0}},
        {"timeSig6", {1.72, 2.0}},
        {"timeSig7", {1.72, 2.0}},
        {"timeSig8", {1.78, 2.0}},
        {"timeSig9", {1.72, 2.0}},
    });
}

} // namespace score_staff
