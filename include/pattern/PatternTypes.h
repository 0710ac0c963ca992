#pragma once

#include "common/Types.h"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chartsense {
namespace pattern {

enum class PatternKind {
    HEAD_AND_SHOULDERS,
    INVERSE_HEAD_AND_SHOULDERS,
    ASCENDING_TRIANGLE,
    DESCENDING_TRIANGLE,
    SYMMETRICAL_TRIANGLE,
    DOUBLE_TOP,
    DOUBLE_BOTTOM
};

// Detection order of the facade.
inline const std::vector<PatternKind>& allPatternKinds() {
    static const std::vector<PatternKind> kinds = {
        PatternKind::HEAD_AND_SHOULDERS,
        PatternKind::INVERSE_HEAD_AND_SHOULDERS,
        PatternKind::ASCENDING_TRIANGLE,
        PatternKind::DESCENDING_TRIANGLE,
        PatternKind::SYMMETRICAL_TRIANGLE,
        PatternKind::DOUBLE_TOP,
        PatternKind::DOUBLE_BOTTOM
    };
    return kinds;
}

enum class DirectionalBias { BULLISH, BEARISH, NEUTRAL };

enum class KeyPointKind { PEAK, TROUGH, TARGET };

enum class LineRole { OUTLINE, NECKLINE, RESISTANCE, SUPPORT };

// "headAndShoulders" 형식 (JSON/설정 파일 공용)
std::string toString(PatternKind kind);
std::string toString(DirectionalBias bias);
std::string toString(KeyPointKind kind);
std::string toString(LineRole role);
std::optional<PatternKind> patternKindFromString(const std::string& value);

struct PatternKeyPoint {
    TimeSec time = 0;
    Price value = 0.0;
    KeyPointKind kind = KeyPointKind::PEAK;
    std::string label;
};

struct LineStyle {
    std::optional<std::string> color;
    std::optional<int> line_width;
    bool dashed = false;
};

// from_index / to_index point into PatternVisualization::key_points
struct PatternLine {
    std::size_t from_index = 0;
    std::size_t to_index = 0;
    LineRole role = LineRole::OUTLINE;
    LineStyle style;
};

struct PatternArea {
    std::vector<std::size_t> points;
    std::string fill_color;
    double opacity = 0.1;
};

struct PatternVisualization {
    std::vector<PatternKeyPoint> key_points;
    std::vector<PatternLine> lines;
    std::vector<PatternArea> areas;
};

struct HeadAndShouldersMetrics {
    int formation_period = 0;
    double symmetry = 0.0;
    Price breakout_level = 0.0;     // neckline
    Price target_level = 0.0;
    Price stop_loss = 0.0;          // head
    Price left_shoulder_price = 0.0;
    Price head_price = 0.0;
    Price right_shoulder_price = 0.0;
    Price left_neckline_price = 0.0;
    Price right_neckline_price = 0.0;
};

struct TriangleMetrics {
    int formation_period = 0;
    Price breakout_level = 0.0;
    Price target_level = 0.0;
    std::optional<Price> downside_target_level;   // symmetrical only
    Price stop_loss = 0.0;
    Price pattern_height = 0.0;
    double upper_slope = 0.0;
    double upper_intercept = 0.0;
    double lower_slope = 0.0;
    double lower_intercept = 0.0;
    Price upper_bound = 0.0;
    Price lower_bound = 0.0;
};

struct DoublePatternMetrics {
    int formation_period = 0;
    Price breakout_level = 0.0;
    Price target_level = 0.0;
    Price stop_loss = 0.0;
    Price first_peak_price = 0.0;
    Price second_peak_price = 0.0;
    Price valley_price = 0.0;
};

using PatternMetrics = std::variant<HeadAndShouldersMetrics, TriangleMetrics, DoublePatternMetrics>;

struct PatternAnalysis {
    PatternKind kind = PatternKind::HEAD_AND_SHOULDERS;
    TimeSec start_time = 0;
    TimeSec end_time = 0;
    std::size_t start_index = 0;
    std::size_t end_index = 0;
    double confidence = 0.0;
    PatternVisualization visualization;
    PatternMetrics metrics;
    DirectionalBias bias = DirectionalBias::NEUTRAL;
};

struct DetectionParams {
    int lookback_period = 60;
    double min_confidence = 0.6;
    std::optional<std::vector<PatternKind>> pattern_kinds;  // nullopt: all kinds
};

// Stable sort by confidence (descending), then truncate to max_results.
void keepTopByConfidence(std::vector<PatternAnalysis>& patterns, int max_results);

// Throws DetectionParamsError.
void validateDetectionParams(const DetectionParams& params);

} // namespace pattern
} // namespace chartsense
