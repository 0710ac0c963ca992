#include "pattern/TriangleValidator.h"
#include <cmath>
#include <utility>

namespace chartsense {
namespace pattern {

TriangleValidator::TriangleValidator(TriangleConfig config, std::shared_ptr<const IConfidencePolicy> policy)
    : config_(config)
    , policy_(std::move(policy))
{}

TriangleValidation TriangleValidator::validate(
    const std::vector<ExtremumPoint>& highs,
    const std::vector<ExtremumPoint>& lows,
    PatternKind kind
) const {
    TriangleValidation result;
    if (highs.size() < 2 || lows.size() < 2) {
        return result;
    }

    result.upper = analytics::TrendLineFitter::fit(highs);
    result.lower = analytics::TrendLineFitter::fit(lows);

    const double hs = result.upper.slope;
    const double ls = result.lower.slope;

    switch (kind) {
        case PatternKind::ASCENDING_TRIANGLE:
            // 상단 수평 + 하단 상승
            result.is_valid = isFlat(hs) && isRising(ls);
            break;
        case PatternKind::DESCENDING_TRIANGLE:
            // 상단 하락 + 하단 수평
            result.is_valid = isFalling(hs) && isFlat(ls);
            break;
        case PatternKind::SYMMETRICAL_TRIANGLE:
            // 양쪽 수렴
            result.is_valid = isFalling(hs) && isRising(ls);
            break;
        default:
            result.is_valid = false;
            break;
    }

    if (result.is_valid) {
        result.confidence = policy_->triangle(kind, hs, ls);
        // 후보 최소 신뢰도 미만은 삼각형으로 보지 않음
        if (result.confidence < config_.min_candidate_confidence) {
            result.is_valid = false;
        }
    }
    return result;
}

bool TriangleValidator::isFlat(double slope) const {
    return std::abs(slope) < config_.slope_threshold;
}

bool TriangleValidator::isRising(double slope) const {
    return slope > config_.slope_threshold;
}

bool TriangleValidator::isFalling(double slope) const {
    return slope < -config_.slope_threshold;
}

} // namespace pattern
} // namespace chartsense
