#pragma once

#include <score_units/unit.hpp>
#include <optional>
#include <string_view>

namespace score_core {

// Physical page geometry. The live area is what remains inside the margins and gutter.
struct Paper {
    score_units::Unit width;
    score_units::Unit height;
    score_units::Unit margin_top;
    score_units::Unit margin_right;
    score_units::Unit margin_bottom;
    score_units::Unit margin_left;
    score_units::Unit gutter;

    score_units::Unit live_width() const {
        return width - margin_left - margin_right - gutter;
    }
    score_units::Unit live_height() const {
        return height - margin_top - margin_bottom;
    }

    static Paper letter();
    static Paper a4();
};

// "letter" or "a4".
std::optional<Paper> paper_from_preset(std::string_view name);

} // namespace score_core
