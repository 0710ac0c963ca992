#pragma once

#include "pattern/PatternTypes.h"
#include <vector>
#include <nlohmann/json.hpp>

namespace chartsense {
namespace pattern {

// nlohmann/json ADL serializers (snake_case keys, camelCase kind names)
void to_json(nlohmann::json& j, const PatternKeyPoint& point);
void to_json(nlohmann::json& j, const LineStyle& style);
void to_json(nlohmann::json& j, const PatternLine& line);
void to_json(nlohmann::json& j, const PatternArea& area);
void to_json(nlohmann::json& j, const PatternVisualization& viz);
void to_json(nlohmann::json& j, const HeadAndShouldersMetrics& m);
void to_json(nlohmann::json& j, const TriangleMetrics& m);
void to_json(nlohmann::json& j, const DoublePatternMetrics& m);
void to_json(nlohmann::json& j, const PatternAnalysis& analysis);

nlohmann::json toJson(const std::vector<PatternAnalysis>& patterns);

} // namespace pattern
} // namespace chartsense
