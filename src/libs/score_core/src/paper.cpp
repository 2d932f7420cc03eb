#include <score_core/paper.hpp>

namespace score_core {

using score_units::mm;

Paper Paper::letter() {
    return Paper{mm(215.9), mm(279.4), mm(20), mm(20), mm(20), mm(20), mm(0)};
}

Paper Paper::a4() {
    return Paper{mm(210), mm(297), mm(20), mm(20), mm(20), mm(20), mm(0)};
}

std::optional<Paper> paper_from_preset(std::string_view name) {
    if (name == "letter") return Paper::letter();
    if (name == "a4") return Paper::a4();
    return std::nullopt;
}

} // namespace score_core
