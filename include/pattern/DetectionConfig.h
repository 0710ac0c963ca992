#pragma once

namespace chartsense {
namespace pattern {

struct ExtremaConfig {
    int radius = 5;
};

struct HeadAndShouldersConfig {
    int min_bars = 15;
    double max_shoulder_diff = 0.03;        // 3%
    double min_candidate_confidence = 0.6;
    int max_results = 3;
};

struct TriangleConfig {
    int min_bars = 20;
    int max_window = 60;
    int window_step = 5;
    double slope_threshold = 0.001;
    double min_candidate_confidence = 0.6;
    int max_results = 2;
};

struct DoublePatternConfig {
    double max_price_diff = 0.01;           // 1%
    double min_candidate_confidence = 0.6;
    int max_results = 2;
};

struct DetectionConfig {
    ExtremaConfig extrema;
    HeadAndShouldersConfig head_and_shoulders;
    TriangleConfig triangle;
    DoublePatternConfig double_pattern;
};

} // namespace pattern
} // namespace chartsense
