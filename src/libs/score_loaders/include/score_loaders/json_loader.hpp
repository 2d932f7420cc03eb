#pragma once

#include <score_core/document.hpp>
#include <score_staff/engraving_settings.hpp>
#include <score_staff/font_metrics.hpp>
#include <score_staff/staff.hpp>
#include <score_staff/staff_group.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace score_loaders {

// A score built from a file. Members are destroyed bottom-up: the document
// (and its staves) first, then the groups, then the metrics the staves use.
struct LoadedScore {
    std::string name;
    std::unique_ptr<score_staff::TableFontMetrics> metrics;
    std::vector<std::unique_ptr<score_staff::StaffGroup>> groups;
    std::unique_ptr<score_core::Document> document;
    std::unordered_map<std::string, score_staff::Staff*> staves_by_id;
};

// A number is taken as a value in `target`; a string goes through
// score_units::parse_unit. Throws score_units::TypeConversionError otherwise.
score_units::Unit unit_from_json(const nlohmann::json& value, score_units::UnitType target);

std::optional<score_staff::EngravingSettings> load_engraving_settings_from_json(const nlohmann::json& j);

std::optional<LoadedScore> load_score_from_json(std::istream& in);
std::optional<LoadedScore> load_score_from_json_file(const std::string& path);

} // namespace score_loaders
