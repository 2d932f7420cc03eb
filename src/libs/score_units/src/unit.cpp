#include <score_units/unit.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace score_units {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

std::string Unit::to_string() const {
    std::ostringstream out;
    out << value_ << ' ' << type_.name;
    return out.str();
}

std::optional<UnitType> unit_type_from_suffix(std::string_view suffix) {
    if (suffix == "u" || suffix == "pt") return unit_types::base;
    if (suffix == "mm") return unit_types::mm;
    if (suffix == "in") return unit_types::inch;
    return std::nullopt;
}

Unit parse_unit(std::string_view text, UnitType target) {
    const std::string_view trimmed = trim(text);
    const std::string buffer(trimmed);
    if (buffer.empty())
        throw TypeConversionError("Unsupported length \"\"");

    const char* begin = buffer.c_str();
    char* end = nullptr;
    const double number = std::strtod(begin, &end);
    if (end == begin)
        throw TypeConversionError("Unsupported length \"" + buffer + "\"");

    const std::string_view suffix = trim(std::string_view(end));
    if (suffix.empty())
        return Unit(number, target);

    auto type = unit_type_from_suffix(suffix);
    if (!type)
        throw TypeConversionError("Unsupported unit suffix in \"" + buffer + "\"");
    return convert(Unit(number, *type), target);
}

std::ostream& operator<<(std::ostream& os, const Unit& value) {
    return os << value.to_string();
}

} // namespace score_units
