#include "pattern/PatternJson.h"
#include <variant>

namespace chartsense {
namespace pattern {

void to_json(nlohmann::json& j, const PatternKeyPoint& point) {
    j = nlohmann::json{
        {"time", point.time},
        {"value", point.value},
        {"kind", toString(point.kind)},
        {"label", point.label}
    };
}

void to_json(nlohmann::json& j, const LineStyle& style) {
    j = nlohmann::json::object();
    if (style.color) j["color"] = *style.color;
    if (style.line_width) j["line_width"] = *style.line_width;
    j["line_style"] = style.dashed ? "dashed" : "solid";
}

void to_json(nlohmann::json& j, const PatternLine& line) {
    j = nlohmann::json{
        {"from_index", line.from_index},
        {"to_index", line.to_index},
        {"role", toString(line.role)},
        {"style", line.style}
    };
}

void to_json(nlohmann::json& j, const PatternArea& area) {
    j = nlohmann::json{
        {"points", area.points},
        {"fill_color", area.fill_color},
        {"opacity", area.opacity}
    };
}

void to_json(nlohmann::json& j, const PatternVisualization& viz) {
    j = nlohmann::json{
        {"key_points", viz.key_points},
        {"lines", viz.lines}
    };
    if (!viz.areas.empty()) {
        j["areas"] = viz.areas;
    }
}

void to_json(nlohmann::json& j, const HeadAndShouldersMetrics& m) {
    j = nlohmann::json{
        {"formation_period", m.formation_period},
        {"symmetry", m.symmetry},
        {"breakout_level", m.breakout_level},
        {"target_level", m.target_level},
        {"stop_loss", m.stop_loss},
        {"left_shoulder_price", m.left_shoulder_price},
        {"head_price", m.head_price},
        {"right_shoulder_price", m.right_shoulder_price},
        {"left_neckline_price", m.left_neckline_price},
        {"right_neckline_price", m.right_neckline_price}
    };
}

void to_json(nlohmann::json& j, const TriangleMetrics& m) {
    j = nlohmann::json{
        {"formation_period", m.formation_period},
        {"breakout_level", m.breakout_level},
        {"target_level", m.target_level},
        {"stop_loss", m.stop_loss},
        {"pattern_height", m.pattern_height},
        {"upper_slope", m.upper_slope},
        {"upper_intercept", m.upper_intercept},
        {"lower_slope", m.lower_slope},
        {"lower_intercept", m.lower_intercept},
        {"upper_bound", m.upper_bound},
        {"lower_bound", m.lower_bound}
    };
    if (m.downside_target_level) {
        j["downside_target_level"] = *m.downside_target_level;
    }
}

void to_json(nlohmann::json& j, const DoublePatternMetrics& m) {
    j = nlohmann::json{
        {"formation_period", m.formation_period},
        {"breakout_level", m.breakout_level},
        {"target_level", m.target_level},
        {"stop_loss", m.stop_loss},
        {"first_peak_price", m.first_peak_price},
        {"second_peak_price", m.second_peak_price},
        {"valley_price", m.valley_price}
    };
}

void to_json(nlohmann::json& j, const PatternAnalysis& analysis) {
    nlohmann::json metrics;
    std::visit([&metrics](const auto& m) { metrics = m; }, analysis.metrics);

    j = nlohmann::json{
        {"kind", toString(analysis.kind)},
        {"start_time", analysis.start_time},
        {"end_time", analysis.end_time},
        {"start_index", analysis.start_index},
        {"end_index", analysis.end_index},
        {"confidence", analysis.confidence},
        {"visualization", analysis.visualization},
        {"metrics", metrics},
        {"directional_bias", toString(analysis.bias)}
    };
}

nlohmann::json toJson(const std::vector<PatternAnalysis>& patterns) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : patterns) {
        out.push_back(p);
    }
    return out;
}

} // namespace pattern
} // namespace chartsense
