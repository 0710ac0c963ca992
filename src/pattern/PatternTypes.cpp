#include "pattern/PatternTypes.h"
#include "common/Errors.h"
#include <algorithm>
#include <cmath>

namespace chartsense {
namespace pattern {

std::string toString(PatternKind kind) {
    switch (kind) {
        case PatternKind::HEAD_AND_SHOULDERS: return "headAndShoulders";
        case PatternKind::INVERSE_HEAD_AND_SHOULDERS: return "inverseHeadAndShoulders";
        case PatternKind::ASCENDING_TRIANGLE: return "ascendingTriangle";
        case PatternKind::DESCENDING_TRIANGLE: return "descendingTriangle";
        case PatternKind::SYMMETRICAL_TRIANGLE: return "symmetricalTriangle";
        case PatternKind::DOUBLE_TOP: return "doubleTop";
        case PatternKind::DOUBLE_BOTTOM: return "doubleBottom";
    }
    return "headAndShoulders";
}

std::string toString(DirectionalBias bias) {
    switch (bias) {
        case DirectionalBias::BULLISH: return "bullish";
        case DirectionalBias::BEARISH: return "bearish";
        case DirectionalBias::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string toString(KeyPointKind kind) {
    switch (kind) {
        case KeyPointKind::PEAK: return "peak";
        case KeyPointKind::TROUGH: return "trough";
        case KeyPointKind::TARGET: return "target";
    }
    return "peak";
}

std::string toString(LineRole role) {
    switch (role) {
        case LineRole::OUTLINE: return "outline";
        case LineRole::NECKLINE: return "neckline";
        case LineRole::RESISTANCE: return "resistance";
        case LineRole::SUPPORT: return "support";
    }
    return "outline";
}

std::optional<PatternKind> patternKindFromString(const std::string& value) {
    for (auto kind : allPatternKinds()) {
        if (toString(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

void keepTopByConfidence(std::vector<PatternAnalysis>& patterns, int max_results) {
    std::stable_sort(patterns.begin(), patterns.end(),
                     [](const PatternAnalysis& a, const PatternAnalysis& b) {
                         return a.confidence > b.confidence;
                     });

    const std::size_t cap = static_cast<std::size_t>(std::max(max_results, 0));
    if (patterns.size() > cap) {
        patterns.erase(patterns.begin() + static_cast<std::ptrdiff_t>(cap), patterns.end());
    }
}

void validateDetectionParams(const DetectionParams& params) {
    if (params.lookback_period <= 0) {
        throw DetectionParamsError(
            "lookback_period must be positive, got " + std::to_string(params.lookback_period));
    }
    if (std::isnan(params.min_confidence) ||
        params.min_confidence < 0.0 || params.min_confidence > 1.0) {
        throw DetectionParamsError(
            "min_confidence must be within [0, 1], got " + std::to_string(params.min_confidence));
    }
}

} // namespace pattern
} // namespace chartsense
