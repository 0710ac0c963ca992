#include "pattern/ConfidencePolicy.h"
#include <algorithm>
#include <cmath>

namespace chartsense {
namespace pattern {

double DefaultConfidencePolicy::headAndShoulders(
    double shoulder_diff,
    double neckline_diff,
    double time_symmetry
) const {
    double confidence = BASE_CONFIDENCE;

    // 어깨 대칭 보너스
    confidence += std::min(0.15, (1.0 - shoulder_diff * 10.0) * 0.15);

    // 넥라인 수평 보너스 (차이가 크면 감점)
    confidence += std::min(0.15, (1.0 - neckline_diff * 20.0) * 0.15);

    // 시간 대칭 보너스
    confidence += time_symmetry * 0.10;

    return std::clamp(confidence, 0.0, HEAD_AND_SHOULDERS_CAP);
}

double DefaultConfidencePolicy::triangle(PatternKind kind, double high_slope, double low_slope) const {
    double bonus = 0.0;

    switch (kind) {
        case PatternKind::ASCENDING_TRIANGLE:
            // 상단 수평일수록 가산
            bonus = (1.0 - std::abs(high_slope) * 100.0) * 0.15;
            break;
        case PatternKind::DESCENDING_TRIANGLE:
            bonus = (1.0 - std::abs(low_slope) * 100.0) * 0.15;
            break;
        case PatternKind::SYMMETRICAL_TRIANGLE: {
            if (std::abs(low_slope) > 0.0) {
                const double convergence_rate = std::abs(high_slope) / std::abs(low_slope);
                // 수렴 속도가 크게 다르면 감점 (rate > 2.67 이면 0.6 미만)
                bonus = (1.0 - std::abs(1.0 - convergence_rate)) * 0.15;
            }
            break;
        }
        default:
            break;
    }

    return std::clamp(BASE_CONFIDENCE + std::min(0.15, bonus), 0.0, 1.0);
}

double DefaultConfidencePolicy::doublePattern(double price_diff) const {
    return std::clamp(BASE_CONFIDENCE + 0.3 * (1.0 - price_diff), 0.0, 1.0);
}

} // namespace pattern
} // namespace chartsense
