#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace score_staff {

// Glyph extents in staff spaces.
struct GlyphBounds {
    double width = 0.0;
    double height = 0.0;
};

// Glyph measurement source. Staves scale the results by their staff space.
class FontMetrics {
public:
    virtual ~FontMetrics() = default;
    virtual std::optional<GlyphBounds> glyph_bounds(const std::string& glyph_name) const = 0;
};

// Metrics from an in-memory table keyed by SMuFL glyph name.
class TableFontMetrics : public FontMetrics {
public:
    TableFontMetrics() = default;
    explicit TableFontMetrics(std::unordered_map<std::string, GlyphBounds> glyphs);

    void set_glyph(const std::string& glyph_name, GlyphBounds bounds);
    std::optional<GlyphBounds> glyph_bounds(const std::string& glyph_name) const override;
    std::size_t size() const { return glyphs_.size(); }

    // Approximate Bravura extents for the glyphs the staff objects draw.
    static TableFontMetrics bravura_subset();

private:
    std::unordered_map<std::string, GlyphBounds> glyphs_;
};

} // namespace score_staff
